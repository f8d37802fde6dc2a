// Weapon kinds, per-level stats and the firing cooldown.
#pragma once

#include <optional>

namespace Game {

enum class WeaponKind { Knife, MagicBlade, HolyWater, SacredFlame };

const char* weaponKindName(WeaponKind kind);

struct WeaponEvolution {
    WeaponKind from;
    WeaponKind to;
    int level;
};

// Knife -> MagicBlade and HolyWater -> SacredFlame, both at level 5.
std::optional<WeaponEvolution> evolutionFor(WeaponKind kind);

class Weapon {
public:
    // Throws std::invalid_argument for a value outside the enum.
    explicit Weapon(WeaponKind kind = WeaponKind::Knife);

    void levelUp();
    void update();
    bool canAttack() const { return cooldown_ <= 0; }
    // Resets the cooldown after firing; `attackSpeedBonus` shortens it.
    void startCooldown(double attackSpeedBonus);

    bool canEvolve() const;

    WeaponKind kind() const { return kind_; }
    int level() const { return level_; }
    int cooldown() const { return cooldown_; }
    void setCooldown(int frames) { cooldown_ = frames < 0 ? 0 : frames; }
    int damage() const { return damage_; }
    int range() const { return range_; }
    int maxCooldown() const { return maxCooldown_; }
    int dotDamage() const { return dotDamage_; }

private:
    void recomputeStats();

    WeaponKind kind_;
    int level_{1};
    int cooldown_{0};
    int damage_{0};
    int range_{0};
    int maxCooldown_{30};
    int dotDamage_{0};
};

}  // namespace Game

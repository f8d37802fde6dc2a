// Leveled passive buffs picked from the level-up screen.
#pragma once

namespace Game {

enum class PassiveKind { SpeedUp, AttackSpeed, HpRegen };

const char* passiveKindName(PassiveKind kind);

class PassiveSkill {
public:
    // Throws std::invalid_argument for a value outside the enum.
    explicit PassiveSkill(PassiveKind kind);

    void levelUp() { level_ += 1; }

    PassiveKind kind() const { return kind_; }
    int level() const { return level_; }
    // SpeedUp: +0.2 speed per level. AttackSpeed: -10% cooldown per level.
    // HpRegen: +0.1 hp per tick per level.
    double bonus() const { return perLevel_ * static_cast<double>(level_); }

private:
    PassiveKind kind_;
    int level_{1};
    double perLevel_{0.0};
};

}  // namespace Game

#include "Weapon.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace Game {

const char* weaponKindName(WeaponKind kind) {
    switch (kind) {
        case WeaponKind::Knife: return "knife";
        case WeaponKind::MagicBlade: return "magic_blade";
        case WeaponKind::HolyWater: return "holy_water";
        case WeaponKind::SacredFlame: return "sacred_flame";
    }
    return "unknown";
}

std::optional<WeaponEvolution> evolutionFor(WeaponKind kind) {
    switch (kind) {
        case WeaponKind::Knife: return WeaponEvolution{WeaponKind::Knife, WeaponKind::MagicBlade, 5};
        case WeaponKind::HolyWater: return WeaponEvolution{WeaponKind::HolyWater, WeaponKind::SacredFlame, 5};
        default: return std::nullopt;
    }
}

Weapon::Weapon(WeaponKind kind) : kind_(kind) { recomputeStats(); }

void Weapon::recomputeStats() {
    const int l = level_ - 1;
    switch (kind_) {
        case WeaponKind::Knife:
            damage_ = 5 + 2 * l;
            range_ = 12 + 2 * l;
            maxCooldown_ = std::max(10, 30 - 2 * l);
            dotDamage_ = 0;
            return;
        case WeaponKind::MagicBlade:
            damage_ = 15 + 3 * l;
            range_ = 24 + 3 * l;
            maxCooldown_ = std::max(8, 30 - 2 * l);
            dotDamage_ = 0;
            return;
        case WeaponKind::HolyWater:
            damage_ = 10 + 3 * l;
            range_ = 16 + 2 * l;
            maxCooldown_ = std::max(15, 30 - l);
            dotDamage_ = 0;
            return;
        case WeaponKind::SacredFlame:
            damage_ = 20 + 4 * l;
            range_ = 24 + 2 * l;
            maxCooldown_ = std::max(12, 30 - l);
            dotDamage_ = 5;
            return;
    }
    throw std::invalid_argument("Unknown weapon kind " + std::to_string(static_cast<int>(kind_)));
}

void Weapon::levelUp() {
    level_ += 1;
    recomputeStats();
}

void Weapon::update() {
    if (cooldown_ > 0) cooldown_ -= 1;
}

void Weapon::startCooldown(double attackSpeedBonus) {
    // Truncation toward zero, as the frame counter is integral.
    int frames = static_cast<int>(static_cast<double>(maxCooldown_) * (1.0 - attackSpeedBonus));
    cooldown_ = std::max(0, frames);
}

bool Weapon::canEvolve() const {
    auto evo = evolutionFor(kind_);
    return evo.has_value() && level_ >= evo->level;
}

}  // namespace Game

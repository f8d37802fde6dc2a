#include "Attack.h"

namespace Game {

Attack::Attack(Engine::Vec2 position, const Weapon& weapon, Engine::Vec2 direction)
    : weapon_(weapon), position_(position) {
    switch (weapon_.kind()) {
        case WeaponKind::Knife:
            lifetime_ = 30;
            velocity_ = direction * 2.0f;
            break;
        case WeaponKind::MagicBlade:
            lifetime_ = 45;
            velocity_ = direction * 3.0f;
            break;
        case WeaponKind::HolyWater:
            lifetime_ = 30;
            break;
        case WeaponKind::SacredFlame:
            lifetime_ = 90;
            break;
    }
}

bool Attack::update() {
    lifetime_ -= 1;
    pulsed_ = false;
    switch (weapon_.kind()) {
        case WeaponKind::Knife:
        case WeaponKind::MagicBlade:
            position_ += velocity_;
            break;
        case WeaponKind::HolyWater:
            break;
        case WeaponKind::SacredFlame:
            dotTimer_ += 1;
            if (dotTimer_ >= kDotInterval) {
                dotTimer_ = 0;
                pulsed_ = true;
            }
            break;
    }
    return pulsed_;
}

int Attack::damageThisTick() const {
    if (weapon_.kind() == WeaponKind::SacredFlame) {
        return pulsed_ ? weapon_.dotDamage() : 0;
    }
    return weapon_.damage();
}

Engine::Gameplay::Rect Attack::hitbox() const {
    const float r = static_cast<float>(weapon_.range());
    return Engine::Gameplay::rectAt(position_, r, r);
}

}  // namespace Game

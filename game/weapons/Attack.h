// Short-lived projectile or area effect spawned when a weapon fires.
#pragma once

#include "../../engine/gameplay/Collision.h"
#include "../../engine/math/Vec2.h"
#include "Weapon.h"

namespace Game {

class Attack {
public:
    static constexpr int kDotInterval = 15;

    // `weapon` is copied: later level-ups do not affect attacks already in flight.
    Attack(Engine::Vec2 position, const Weapon& weapon, Engine::Vec2 direction);

    // Advances one tick. Returns true on damage-over-time pulse ticks.
    bool update();
    bool isAlive() const { return lifetime_ > 0; }

    // True if the latest update() was a pulse tick.
    bool pulsed() const { return pulsed_; }

    // Damage dealt to one overlapping enemy this tick; 0 when the attack does not hit this tick.
    int damageThisTick() const;

    Engine::Gameplay::Rect hitbox() const;

    const Weapon& weapon() const { return weapon_; }
    WeaponKind kind() const { return weapon_.kind(); }
    const Engine::Vec2& position() const { return position_; }
    const Engine::Vec2& velocity() const { return velocity_; }
    int lifetime() const { return lifetime_; }

private:
    Weapon weapon_;
    Engine::Vec2 position_{};
    Engine::Vec2 velocity_{};
    int lifetime_{0};
    int dotTimer_{0};
    bool pulsed_{false};
};

}  // namespace Game

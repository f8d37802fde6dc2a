// A live enemy: position, health and the movement strategy of its kind.
#pragma once

#include <memory>
#include <random>

#include "../../engine/math/Vec2.h"
#include "EnemyBehavior.h"
#include "EnemyKind.h"

namespace Game {

class Enemy {
public:
    static constexpr float kSize = 8.0f;

    // Base stats for the kind.
    Enemy(EnemyKind kind, Engine::Vec2 position, std::mt19937& rng);
    // Explicit stats, e.g. scaled by elapsed time.
    Enemy(EnemyKind kind, const EnemyStats& stats, Engine::Vec2 position, std::mt19937& rng);

    void update(const Engine::Vec2& target, std::mt19937& rng);
    void takeDamage(int amount) { hp_ -= amount; }
    bool isAlive() const { return hp_ > 0; }

    EnemyKind kind() const { return kind_; }
    const EnemyStats& stats() const { return stats_; }
    const EnemyBehavior& behavior() const { return *behavior_; }
    const Engine::Vec2& position() const { return position_; }
    void setPosition(const Engine::Vec2& pos) { position_ = pos; }
    int hp() const { return hp_; }
    int exp() const { return stats_.exp; }
    int color() const { return stats_.color; }
    int movementTicks() const { return movementTicks_; }

private:
    EnemyKind kind_;
    EnemyStats stats_;
    Engine::Vec2 position_{};
    int hp_{0};
    int movementTicks_{0};
    std::unique_ptr<EnemyBehavior> behavior_;
};

}  // namespace Game

// Movement strategies, one per enemy; chosen from the kind's stat row.
#pragma once

#include <memory>
#include <random>

#include "../../engine/math/Vec2.h"
#include "EnemyKind.h"

namespace Game {

class EnemyBehavior {
public:
    virtual ~EnemyBehavior() = default;

    // Moves `position` one tick relative to `target`.
    virtual void step(Engine::Vec2& position, const Engine::Vec2& target, float speed, std::mt19937& rng) = 0;
    virtual BehaviorKind kind() const = 0;

    // Drawing hooks; defaults mean "no effect".
    virtual int ticksUntilTeleport() const { return -1; }
    virtual float phase() const { return 0.0f; }
};

class ChaseBehavior final : public EnemyBehavior {
public:
    void step(Engine::Vec2& position, const Engine::Vec2& target, float speed, std::mt19937& rng) override;
    BehaviorKind kind() const override { return BehaviorKind::Chase; }
};

class CircleBehavior final : public EnemyBehavior {
public:
    CircleBehavior(float radius, float angularSpeed, float initialAngle)
        : radius_(radius), angularSpeed_(angularSpeed), angle_(initialAngle) {}

    void step(Engine::Vec2& position, const Engine::Vec2& target, float speed, std::mt19937& rng) override;
    BehaviorKind kind() const override { return BehaviorKind::Circle; }
    float phase() const override { return angle_; }

    float radius() const { return radius_; }
    float angularSpeed() const { return angularSpeed_; }

private:
    float radius_;
    float angularSpeed_;
    float angle_;
};

class TeleportBehavior final : public EnemyBehavior {
public:
    static constexpr int kMinJump = 20;
    static constexpr int kMaxJump = 40;

    explicit TeleportBehavior(int cooldown) : cooldown_(cooldown) {}

    void step(Engine::Vec2& position, const Engine::Vec2& target, float speed, std::mt19937& rng) override;
    BehaviorKind kind() const override { return BehaviorKind::Teleport; }
    int ticksUntilTeleport() const override { return cooldown_ - timer_; }

private:
    int cooldown_;
    int timer_{0};
};

class ZigzagBehavior final : public EnemyBehavior {
public:
    ZigzagBehavior(float width, float phaseSpeed) : width_(width), phaseSpeed_(phaseSpeed) {}

    void step(Engine::Vec2& position, const Engine::Vec2& target, float speed, std::mt19937& rng) override;
    BehaviorKind kind() const override { return BehaviorKind::Zigzag; }
    float phase() const override { return phase_; }

private:
    float width_;
    float phaseSpeed_;
    float phase_{0.0f};
};

// Bat orbits start at a random angle drawn from `rng`.
std::unique_ptr<EnemyBehavior> makeBehavior(const EnemyStats& stats, std::mt19937& rng);

}  // namespace Game

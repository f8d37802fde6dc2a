#include "EnemyBehavior.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace Game {

namespace {
constexpr float kTwoPi = 6.28318530718f;
}  // namespace

void ChaseBehavior::step(Engine::Vec2& position, const Engine::Vec2& target, float speed, std::mt19937& /*rng*/) {
    Engine::Vec2 delta = target - position;
    float dist = Engine::length(delta);
    if (dist <= 0.0f) return;
    position += delta * (speed / dist);
}

void CircleBehavior::step(Engine::Vec2& position, const Engine::Vec2& target, float speed, std::mt19937& /*rng*/) {
    angle_ += angularSpeed_;
    Engine::Vec2 orbit{target.x + std::cos(angle_) * radius_, target.y + std::sin(angle_) * radius_};
    // Fractional approach, capped at 1 so scaled bats land on the orbit instead of overshooting.
    const float fraction = std::clamp(speed, 0.0f, 1.0f);
    position += (orbit - position) * fraction;
}

void TeleportBehavior::step(Engine::Vec2& position, const Engine::Vec2& target, float speed, std::mt19937& rng) {
    Engine::Vec2 delta = target - position;
    float dist = Engine::length(delta);
    if (dist > 0.0f) {
        position += delta * (speed * 0.5f / dist);
    }
    timer_ += 1;
    if (timer_ >= cooldown_) {
        std::uniform_real_distribution<float> angleDist(0.0f, kTwoPi);
        std::uniform_int_distribution<int> jumpDist(kMinJump, kMaxJump);
        float angle = angleDist(rng);
        float jump = static_cast<float>(jumpDist(rng));
        position = Engine::Vec2{target.x + std::cos(angle) * jump, target.y + std::sin(angle) * jump};
        timer_ = 0;
    }
}

void ZigzagBehavior::step(Engine::Vec2& position, const Engine::Vec2& target, float speed, std::mt19937& /*rng*/) {
    Engine::Vec2 delta = target - position;
    float dist = Engine::length(delta);
    if (dist <= 0.0f) return;
    Engine::Vec2 base = delta * (speed / dist);
    phase_ += phaseSpeed_;
    // Left normal of the speed-scaled step.
    Engine::Vec2 normal{-base.y, base.x};
    float sway = std::sin(phase_) * width_;
    position += base + normal * sway;
}

std::unique_ptr<EnemyBehavior> makeBehavior(const EnemyStats& stats, std::mt19937& rng) {
    switch (stats.behavior) {
        case BehaviorKind::Chase: return std::make_unique<ChaseBehavior>();
        case BehaviorKind::Circle: {
            std::uniform_real_distribution<float> angleDist(0.0f, kTwoPi);
            return std::make_unique<CircleBehavior>(stats.circleRadius, stats.circleSpeed, angleDist(rng));
        }
        case BehaviorKind::Teleport: return std::make_unique<TeleportBehavior>(stats.teleportCooldown);
        case BehaviorKind::Zigzag: return std::make_unique<ZigzagBehavior>(stats.zigzagWidth, stats.zigzagSpeed);
    }
    throw std::invalid_argument("Unknown enemy behavior");
}

}  // namespace Game

#include "Enemy.h"

namespace Game {

Enemy::Enemy(EnemyKind kind, Engine::Vec2 position, std::mt19937& rng)
    : Enemy(kind, enemyStats(kind), position, rng) {}

Enemy::Enemy(EnemyKind kind, const EnemyStats& stats, Engine::Vec2 position, std::mt19937& rng)
    : kind_(kind), stats_(stats), position_(position), hp_(stats.hp), behavior_(makeBehavior(stats, rng)) {}

void Enemy::update(const Engine::Vec2& target, std::mt19937& rng) {
    movementTicks_ += 1;
    behavior_->step(position_, target, stats_.speed, rng);
}

}  // namespace Game

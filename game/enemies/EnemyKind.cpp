#include "EnemyKind.h"

#include <cmath>
#include <stdexcept>
#include <string>

namespace Game {

namespace {
EnemyStats makeZombie() {
    EnemyStats s;
    s.hp = 10;
    s.speed = 0.5f;
    s.exp = 1;
    s.color = 11;
    s.behavior = BehaviorKind::Chase;
    return s;
}

EnemyStats makeBat() {
    EnemyStats s;
    s.hp = 8;
    s.speed = 1.0f;
    s.exp = 2;
    s.color = 2;
    s.behavior = BehaviorKind::Circle;
    s.circleRadius = 20.0f;
    s.circleSpeed = 0.1f;
    return s;
}

EnemyStats makeGhost() {
    EnemyStats s;
    s.hp = 15;
    s.speed = 0.3f;
    s.exp = 3;
    s.color = 7;
    s.behavior = BehaviorKind::Teleport;
    s.teleportCooldown = 60;
    return s;
}

EnemyStats makeSkeleton() {
    EnemyStats s;
    s.hp = 12;
    s.speed = 0.4f;
    s.exp = 2;
    s.color = 6;
    s.behavior = BehaviorKind::Zigzag;
    s.zigzagWidth = 30.0f;
    s.zigzagSpeed = 0.05f;
    return s;
}
}  // namespace

const EnemyStats& enemyStats(EnemyKind kind) {
    static const EnemyStats zombie = makeZombie();
    static const EnemyStats bat = makeBat();
    static const EnemyStats ghost = makeGhost();
    static const EnemyStats skeleton = makeSkeleton();
    switch (kind) {
        case EnemyKind::Zombie: return zombie;
        case EnemyKind::Bat: return bat;
        case EnemyKind::Ghost: return ghost;
        case EnemyKind::Skeleton: return skeleton;
    }
    throw std::invalid_argument("Unknown enemy kind " + std::to_string(static_cast<int>(kind)));
}

const char* enemyKindName(EnemyKind kind) {
    switch (kind) {
        case EnemyKind::Zombie: return "zombie";
        case EnemyKind::Bat: return "bat";
        case EnemyKind::Ghost: return "ghost";
        case EnemyKind::Skeleton: return "skeleton";
    }
    return "unknown";
}

std::optional<EnemyKind> parseEnemyKind(std::string_view name) {
    for (EnemyKind kind : kAllEnemyKinds) {
        if (name == enemyKindName(kind)) return kind;
    }
    return std::nullopt;
}

EnemyStats scaledEnemyStats(EnemyKind kind, int elapsedMinutes, const DifficultyScaling& scaling) {
    EnemyStats s = enemyStats(kind);
    if (elapsedMinutes <= 0) return s;
    const float m = static_cast<float>(elapsedMinutes);
    s.hp = static_cast<int>(std::floor(static_cast<float>(s.hp) * (1.0f + scaling.hpPerMinute * m)));
    s.speed = s.speed * (1.0f + scaling.speedPerMinute * m);
    s.exp = static_cast<int>(std::floor(static_cast<float>(s.exp) * (1.0f + scaling.expPerMinute * m)));
    return s;
}

}  // namespace Game

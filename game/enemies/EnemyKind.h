// Enemy archetypes and their immutable stat rows.
#pragma once

#include <array>
#include <optional>
#include <string_view>

namespace Game {

enum class EnemyKind { Zombie, Bat, Ghost, Skeleton };

enum class BehaviorKind { Chase, Circle, Teleport, Zigzag };

constexpr std::array<EnemyKind, 4> kAllEnemyKinds{EnemyKind::Zombie, EnemyKind::Bat, EnemyKind::Ghost,
                                                  EnemyKind::Skeleton};

struct EnemyStats {
    int hp{1};
    float speed{0.0f};
    int exp{0};
    int color{0};  // palette index
    BehaviorKind behavior{BehaviorKind::Chase};

    // Behavior parameters; only the ones matching `behavior` are meaningful.
    float circleRadius{0.0f};
    float circleSpeed{0.0f};
    int teleportCooldown{0};
    float zigzagWidth{0.0f};
    float zigzagSpeed{0.0f};
};

// Throws std::invalid_argument for a value outside the enum.
const EnemyStats& enemyStats(EnemyKind kind);

const char* enemyKindName(EnemyKind kind);
std::optional<EnemyKind> parseEnemyKind(std::string_view name);

// Per-minute growth applied to freshly spawned enemies.
struct DifficultyScaling {
    float hpPerMinute{0.10f};
    float speedPerMinute{0.05f};
    float expPerMinute{0.20f};
};

EnemyStats scaledEnemyStats(EnemyKind kind, int elapsedMinutes, const DifficultyScaling& scaling);

}  // namespace Game

// Gameplay tuning loaded from data/gameplay.json.
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "../engine/core/Logger.h"
#include "enemies/EnemyKind.h"

namespace Game {

struct SpawnConfig {
    int initialInterval{30};  // ticks between spawns at minute 0
    int minInterval{10};
    int reductionPerMinute{2};
    // Relative weights; they do not need to sum to 1.
    std::vector<std::pair<EnemyKind, float>> weights{{EnemyKind::Zombie, 0.50f},
                                                     {EnemyKind::Bat, 0.20f},
                                                     {EnemyKind::Skeleton, 0.15f},
                                                     {EnemyKind::Ghost, 0.15f}};

    int intervalAt(int elapsedMinutes) const;
};

struct GameConfig {
    int screenWidth{160};
    int screenHeight{120};
    int windowScale{4};

    SpawnConfig spawn{};
    DifficultyScaling difficulty{};

    int baseBpm{120};
    float musicVolume{0.6f};

    std::uint32_t seed{0};  // 0 picks a random seed
    std::string highScorePath{"saves/highscore.dat"};
    Engine::LogLevel logLevel{Engine::LogLevel::Info};
};

class GameConfigLoader {
public:
    static std::optional<GameConfig> loadFromFile(const std::string& path);
    static std::optional<GameConfig> loadFromString(const std::string& text);
};

}  // namespace Game

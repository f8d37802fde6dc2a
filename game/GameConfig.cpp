#include "GameConfig.h"

#include <algorithm>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace Game {

int SpawnConfig::intervalAt(int elapsedMinutes) const {
    return std::max(minInterval, initialInterval - reductionPerMinute * elapsedMinutes);
}

namespace {
bool readWeights(const nlohmann::json& j, std::vector<std::pair<EnemyKind, float>>& out) {
    if (!j.is_object()) {
        Engine::logError("gameplay.json: spawn.weights must be an object.");
        return false;
    }
    std::vector<std::pair<EnemyKind, float>> weights;
    for (auto it = j.begin(); it != j.end(); ++it) {
        auto kind = parseEnemyKind(it.key());
        if (!kind) {
            Engine::logError("gameplay.json: unknown enemy kind '" + it.key() + "'.");
            return false;
        }
        float w = it.value().get<float>();
        if (w < 0.0f) {
            Engine::logError("gameplay.json: negative spawn weight for '" + it.key() + "'.");
            return false;
        }
        weights.emplace_back(*kind, w);
    }
    float total = 0.0f;
    for (const auto& entry : weights) total += entry.second;
    if (weights.empty() || total <= 0.0f) {
        Engine::logError("gameplay.json: spawn.weights has no positive entry.");
        return false;
    }
    out = std::move(weights);
    return true;
}
}  // namespace

std::optional<GameConfig> GameConfigLoader::loadFromString(const std::string& text) {
    GameConfig cfg;
    try {
        auto j = nlohmann::json::parse(text);
        if (!j.is_object()) {
            Engine::logWarn("gameplay.json must be a JSON object.");
            return std::nullopt;
        }

        if (j.contains("screen")) {
            const auto& s = j["screen"];
            cfg.screenWidth = s.value("width", cfg.screenWidth);
            cfg.screenHeight = s.value("height", cfg.screenHeight);
            cfg.windowScale = s.value("scale", cfg.windowScale);
        }
        if (cfg.screenWidth <= 8 || cfg.screenHeight <= 8 || cfg.windowScale < 1) {
            Engine::logError("gameplay.json: screen size too small.");
            return std::nullopt;
        }

        if (j.contains("spawn")) {
            const auto& s = j["spawn"];
            cfg.spawn.initialInterval = s.value("initial_interval", cfg.spawn.initialInterval);
            cfg.spawn.minInterval = s.value("min_interval", cfg.spawn.minInterval);
            cfg.spawn.reductionPerMinute = s.value("reduction_per_minute", cfg.spawn.reductionPerMinute);
            if (s.contains("weights") && !readWeights(s["weights"], cfg.spawn.weights)) {
                return std::nullopt;
            }
        }
        if (cfg.spawn.minInterval < 1 || cfg.spawn.initialInterval < cfg.spawn.minInterval) {
            Engine::logError("gameplay.json: spawn intervals must satisfy 1 <= min <= initial.");
            return std::nullopt;
        }

        if (j.contains("difficulty")) {
            const auto& d = j["difficulty"];
            cfg.difficulty.hpPerMinute = d.value("hp_per_minute", cfg.difficulty.hpPerMinute);
            cfg.difficulty.speedPerMinute = d.value("speed_per_minute", cfg.difficulty.speedPerMinute);
            cfg.difficulty.expPerMinute = d.value("exp_per_minute", cfg.difficulty.expPerMinute);
        }

        if (j.contains("music")) {
            const auto& m = j["music"];
            cfg.baseBpm = m.value("base_bpm", cfg.baseBpm);
            cfg.musicVolume = std::clamp(m.value("volume", cfg.musicVolume), 0.0f, 1.0f);
        }
        if (cfg.baseBpm < 1) {
            Engine::logError("gameplay.json: music.base_bpm must be positive.");
            return std::nullopt;
        }

        cfg.seed = j.value("seed", cfg.seed);
        cfg.highScorePath = j.value("high_score_path", cfg.highScorePath);
        if (j.contains("log_level")) {
            auto level = Engine::parseLogLevel(j["log_level"].get<std::string>());
            if (level) {
                cfg.logLevel = *level;
            } else {
                Engine::logWarn("gameplay.json: unknown log_level, keeping info.");
            }
        }
    } catch (const nlohmann::json::exception& e) {
        Engine::logWarn(std::string("gameplay.json parse error: ") + e.what());
        return std::nullopt;
    }
    return cfg;
}

std::optional<GameConfig> GameConfigLoader::loadFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return loadFromString(buffer.str());
}

}  // namespace Game

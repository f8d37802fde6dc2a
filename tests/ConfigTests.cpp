// Gameplay config and input binding loaders, plus log level parsing.
#include <cassert>
#include <string>

#include "../engine/core/Logger.h"
#include "../engine/input/InputLoader.h"
#include "../game/GameConfig.h"

using namespace Game;

int main() {
    {
        auto cfg = GameConfigLoader::loadFromString("{}");
        assert(cfg.has_value());
        assert(cfg->screenWidth == 160 && cfg->screenHeight == 120 && cfg->windowScale == 4);
        assert(cfg->spawn.initialInterval == 30 && cfg->spawn.minInterval == 10);
        assert(cfg->spawn.weights.size() == 4);
        assert(cfg->baseBpm == 120);
        assert(cfg->seed == 0);
    }
    {
        const std::string text = R"({
            "screen": {"width": 200, "height": 150, "scale": 3},
            "spawn": {"initial_interval": 40, "min_interval": 12, "reduction_per_minute": 4,
                      "weights": {"bat": 1.0, "ghost": 3.0}},
            "difficulty": {"hp_per_minute": 0.5},
            "music": {"base_bpm": 100, "volume": 2.0},
            "seed": 99,
            "high_score_path": "tmp/score.bin",
            "log_level": "debug"
        })";
        auto cfg = GameConfigLoader::loadFromString(text);
        assert(cfg.has_value());
        assert(cfg->screenWidth == 200 && cfg->screenHeight == 150 && cfg->windowScale == 3);
        assert(cfg->spawn.intervalAt(0) == 40 && cfg->spawn.intervalAt(5) == 20 && cfg->spawn.intervalAt(10) == 12);
        assert(cfg->spawn.weights.size() == 2);
        float ghost = 0.0f;
        for (const auto& w : cfg->spawn.weights) {
            if (w.first == EnemyKind::Ghost) ghost = w.second;
        }
        assert(ghost == 3.0f);
        assert(cfg->difficulty.hpPerMinute == 0.5f);
        assert(cfg->baseBpm == 100);
        assert(cfg->musicVolume == 1.0f);
        assert(cfg->seed == 99u);
        assert(cfg->highScorePath == "tmp/score.bin");
        assert(cfg->logLevel == Engine::LogLevel::Debug);
    }
    {
        assert(!GameConfigLoader::loadFromString(R"({"spawn": {"weights": {"dragon": 1.0}}})").has_value());
        assert(!GameConfigLoader::loadFromString(R"({"spawn": {"weights": {"bat": 0.0}}})").has_value());
        assert(!GameConfigLoader::loadFromString(R"({"spawn": {"min_interval": 0}})").has_value());
        assert(!GameConfigLoader::loadFromString(R"({"screen": {"width": 4}})").has_value());
        assert(!GameConfigLoader::loadFromString(R"({"music": {"base_bpm": "fast"}})").has_value());
        assert(!GameConfigLoader::loadFromString("{ not json").has_value());
        assert(!GameConfigLoader::loadFromString("[1, 2]").has_value());
        assert(!GameConfigLoader::loadFromFile("does/not/exist.json").has_value());
    }
    {
        // The shipped file matches the built-in defaults.
        auto shipped = GameConfigLoader::loadFromFile("data/gameplay.json");
        assert(shipped.has_value());
        GameConfig defaults{};
        assert(shipped->screenWidth == defaults.screenWidth);
        assert(shipped->spawn.initialInterval == defaults.spawn.initialInterval);
        assert(shipped->spawn.weights.size() == defaults.spawn.weights.size());
        assert(shipped->baseBpm == defaults.baseBpm);
    }
    {
        auto bindings = Engine::InputLoader::loadFromString(R"({"confirm": ["K"], "cancel": []})");
        assert(bindings.has_value());
        assert(bindings->confirm.size() == 1 && bindings->confirm[0] == "K");
        assert(bindings->cancel.size() == 1 && bindings->cancel[0] == "Escape");
        assert(bindings->up[0] == "Up");
        assert(!Engine::InputLoader::loadFromString("nope").has_value());
        assert(!Engine::InputLoader::loadFromString("42").has_value());
        assert(Engine::InputLoader::loadFromFile("data/input_bindings.json").has_value());
    }
    {
        assert(Engine::parseLogLevel("WARN") == Engine::LogLevel::Warning);
        assert(Engine::parseLogLevel("warning") == Engine::LogLevel::Warning);
        assert(Engine::parseLogLevel("Error") == Engine::LogLevel::Error);
        assert(!Engine::parseLogLevel("loud").has_value());
        Engine::Logger::setMinLevel(Engine::LogLevel::Error);
        assert(Engine::Logger::minLevel() == Engine::LogLevel::Error);
        Engine::logInfo("suppressed");
        Engine::Logger::setMinLevel(Engine::LogLevel::Info);
    }
    return 0;
}

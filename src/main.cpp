#include <memory>
#include <string>

#define SDL_MAIN_HANDLED
#include <SDL.h>

#include "../engine/audio/ToneSynth.h"
#include "../engine/core/Application.h"
#include "../engine/core/Logger.h"
#include "../engine/input/InputLoader.h"
#include "../engine/platform/SDLWindow.h"
#include "../game/Game.h"
#include "../game/GameConfig.h"
#include "../game/music/MusicSamples.h"

namespace {
constexpr const char* kGameplayPath = "data/gameplay.json";
constexpr const char* kBindingsPath = "data/input_bindings.json";
constexpr int kSynthChannels = 4;
}  // namespace

int main() {
    SDL_SetMainReady();

    Game::GameConfig gameConfig{};
    if (auto loaded = Game::GameConfigLoader::loadFromFile(kGameplayPath)) {
        gameConfig = *loaded;
        Engine::logInfo(std::string("Loaded gameplay config from ") + kGameplayPath);
    } else {
        Engine::logWarn(std::string("Using default gameplay config; could not load ") + kGameplayPath);
    }
    Engine::Logger::setMinLevel(gameConfig.logLevel);

    Engine::WindowConfig config{};
    config.logicalWidth = gameConfig.screenWidth;
    config.logicalHeight = gameConfig.screenHeight;
    config.scale = gameConfig.windowScale;
    if (auto bindings = Engine::InputLoader::loadFromFile(kBindingsPath)) {
        config.bindings = *bindings;
        Engine::logInfo(std::string("Loaded input bindings from ") + kBindingsPath);
    } else {
        Engine::logWarn(std::string("Using default input bindings; could not load ") + kBindingsPath);
    }

    int exitCode = 0;
    {
        Engine::Audio::ToneSynth synth(kSynthChannels);
        if (synth.initialize()) {
            synth.setVolume(gameConfig.musicVolume);
            int registered = 0;
            for (const auto& entry : Game::musicSampleBank(1.0f)) {
                if (synth.registerTone(entry.first, entry.second)) ++registered;
            }
            Engine::logInfo("Synth ready with " + std::to_string(registered) + " tones.");
        } else {
            Engine::logWarn("Audio unavailable; continuing without music.");
        }

        Game::GameRoot game(gameConfig, synth);
        auto window = std::make_unique<Engine::SDLWindow>();

        Engine::Application app(game, std::move(window), config);
        if (app.initialize()) {
            app.run();
        } else {
            exitCode = 1;
        }
    }

    SDL_Quit();
    return exitCode;
}

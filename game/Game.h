// Game layer bootstrap implementing engine callbacks.
#pragma once

#include <memory>

#include "../engine/audio/Synth.h"
#include "../engine/core/ApplicationListener.h"
#include "../engine/input/ActionMapper.h"
#include "../engine/render/BitmapTextRenderer.h"
#include "GameConfig.h"
#include "Simulation.h"
#include "meta/ScoreStore.h"
#include "render/RenderSystem.h"

namespace Engine {
class Application;
}

namespace Game {

class GameRoot final : public Engine::ApplicationListener {
public:
    GameRoot(GameConfig config, Engine::Audio::Synth& synth);

    bool onInitialize(Engine::Application& app) override;
    void onUpdate(const Engine::TimeStep& step, const Engine::InputState& input) override;
    void onRender() override;
    void onShutdown() override;

    // Null until onInitialize ran.
    const Simulation* simulation() const { return sim_.get(); }

private:
    void loadHighScore();
    void saveHighScore();

    GameConfig config_;
    Engine::Audio::Synth& synth_;
    Engine::Application* app_{nullptr};
    Engine::ActionMapper actionMapper_{};
    ScoreStore scoreStore_;
    int loadedHighScore_{0};
    std::unique_ptr<Simulation> sim_;
    std::unique_ptr<Engine::BitmapTextRenderer> textRenderer_;
    std::unique_ptr<RenderSystem> renderSystem_;
};

}  // namespace Game

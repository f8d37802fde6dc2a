#include "Game.h"

#include <string>

#include "../engine/core/Application.h"
#include "../engine/core/Logger.h"

namespace Game {

GameRoot::GameRoot(GameConfig config, Engine::Audio::Synth& synth)
    : config_(std::move(config)), synth_(synth), scoreStore_(config_.highScorePath) {}

bool GameRoot::onInitialize(Engine::Application& app) {
    app_ = &app;
    sim_ = std::make_unique<Simulation>(config_);
    Engine::logInfo("GameRoot initialized (seed " + std::to_string(sim_->seed()) + ").");
    loadHighScore();

    textRenderer_ = std::make_unique<Engine::BitmapTextRenderer>(app.renderer());
    renderSystem_ = std::make_unique<RenderSystem>(app.renderer(), *textRenderer_);
    return true;
}

void GameRoot::onUpdate(const Engine::TimeStep& /*step*/, const Engine::InputState& input) {
    if (!sim_) return;
    const Engine::ActionState actions = actionMapper_.sample(input);
    if (actions.cancel) {
        app_->requestQuit("Cancel pressed");
        return;
    }
    sim_->update(actions, synth_);
}

void GameRoot::onRender() {
    if (!sim_ || !renderSystem_) return;
    renderSystem_->draw(*sim_);
}

void GameRoot::onShutdown() {
    saveHighScore();
    Engine::logInfo("GameRoot shutdown.");
}

void GameRoot::loadHighScore() {
    auto record = scoreStore_.load();
    if (!record) {
        Engine::logInfo("No high score loaded from " + scoreStore_.path() + "; starting at 0.");
        return;
    }
    loadedHighScore_ = record->highScore;
    sim_->setHighScore(record->highScore);
    Engine::logInfo("Loaded high score " + std::to_string(record->highScore) + ".");
}

void GameRoot::saveHighScore() {
    if (!sim_) return;
    const int best = sim_->highScore();
    if (best <= loadedHighScore_) return;
    ScoreRecord record;
    record.highScore = best;
    if (scoreStore_.save(record)) {
        Engine::logInfo("Saved high score " + std::to_string(best) + " to " + scoreStore_.path() + ".");
    } else {
        Engine::logWarn("Failed to save high score to " + scoreStore_.path() + ".");
    }
}

}  // namespace Game

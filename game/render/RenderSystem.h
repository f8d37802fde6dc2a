// Draws the simulation state: entities with their effects, the level-up overlay and the HUD.
#pragma once

#include <string>

#include "../../engine/render/RenderDevice.h"
#include "../../engine/render/TextRenderer.h"
#include "../Simulation.h"

namespace Game {

class RenderSystem {
public:
    RenderSystem(Engine::RenderDevice& device, Engine::TextRenderer& text) : device_(device), text_(text) {}

    void draw(const Simulation& sim);

private:
    void drawPlayer(const Player& player);
    void drawAttack(const Attack& attack);
    void drawEnemy(const Enemy& enemy);
    void drawLevelUp(const LevelUpChoice& choice);
    void drawHud(const Simulation& sim);
    void text(const std::string& str, float x, float y, int color);

    Engine::RenderDevice& device_;
    Engine::TextRenderer& text_;
};

}  // namespace Game

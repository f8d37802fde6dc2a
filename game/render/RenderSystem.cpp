#include "RenderSystem.h"

#include <cmath>
#include <string>

#include "../../engine/render/Color.h"

namespace Game {

namespace {
constexpr int kBackground = 0;
constexpr int kPlayerColor = 7;
constexpr int kFacingColor = 8;
constexpr int kKnifeColor = 12;
constexpr int kWaterColor = 6;
constexpr int kFlameColor = 8;
constexpr int kOverlayColor = 1;
constexpr int kSelectedColor = 7;
constexpr int kOptionColor = 13;
constexpr int kHudColor = 7;

Engine::Vec2 square(float side) { return Engine::Vec2{side, side}; }
}  // namespace

void RenderSystem::text(const std::string& str, float x, float y, int color) {
    text_.drawText(str, Engine::Vec2{x, y}, 1.0f, Engine::paletteColor(color));
}

void RenderSystem::draw(const Simulation& sim) {
    device_.clear(Engine::paletteColor(kBackground));

    drawPlayer(sim.player());
    for (const auto& enemy : sim.enemies()) {
        drawEnemy(enemy);
    }

    if (sim.mode() == SimMode::ChoosingLevelUp && sim.pendingChoice()) {
        drawLevelUp(*sim.pendingChoice());
    }
    drawHud(sim);
}

void RenderSystem::drawPlayer(const Player& player) {
    const Engine::Vec2 pos = player.position();
    device_.drawFilledRect(pos, square(Player::kSize), Engine::paletteColor(kPlayerColor));
    const Engine::Vec2 center = pos + Engine::Vec2{Player::kSize / 2.0f, Player::kSize / 2.0f};
    device_.drawLine(center, center + player.facing() * 8.0f, Engine::paletteColor(kFacingColor));

    for (const auto& attack : player.attacks()) {
        drawAttack(attack);
    }
}

void RenderSystem::drawAttack(const Attack& attack) {
    const Engine::Vec2 pos = attack.position();
    const float radius = static_cast<float>(attack.weapon().range() / 2);
    switch (attack.kind()) {
        case WeaponKind::Knife:
            device_.drawFilledRect(pos, square(4.0f), Engine::paletteColor(kKnifeColor));
            break;
        case WeaponKind::MagicBlade:
            device_.drawFilledRect(pos, square(6.0f), Engine::paletteColor(kWaterColor));
            for (int i = 0; i < 3; ++i) {
                const float offset = static_cast<float>((i + 1) * 2);
                device_.drawFilledRect(pos - attack.velocity() * offset, square(4.0f),
                                       Engine::paletteColor(kWaterColor));
            }
            break;
        case WeaponKind::HolyWater:
            device_.drawCircleOutline(pos, radius, Engine::paletteColor(kWaterColor));
            break;
        case WeaponKind::SacredFlame: {
            const auto color = Engine::paletteColor(kFlameColor);
            device_.drawCircleOutline(pos, radius, color);
            device_.drawCircleOutline(pos, std::floor(radius * 2.0f / 3.0f), color);
            if (attack.lifetime() % 4 < 2) {
                device_.drawCircleOutline(pos, radius - 2.0f, color);
            }
            break;
        }
    }
}

void RenderSystem::drawEnemy(const Enemy& enemy) {
    const Engine::Vec2 pos = enemy.position();
    const auto color = Engine::paletteColor(enemy.color());
    device_.drawFilledRect(pos, square(Enemy::kSize), color);

    const EnemyBehavior& behavior = enemy.behavior();
    const EnemyStats& stats = enemy.stats();
    switch (behavior.kind()) {
        case BehaviorKind::Teleport:
            // Blink for the last 10 ticks before a jump.
            if (behavior.ticksUntilTeleport() <= 10 && enemy.movementTicks() % 4 < 2) {
                device_.drawFilledRect(pos - Engine::Vec2{1.0f, 1.0f}, square(Enemy::kSize + 2.0f),
                                       Engine::paletteColor(7));
            }
            break;
        case BehaviorKind::Circle: {
            float angle = behavior.phase() - stats.circleSpeed * 3.0f;
            for (int i = 0; i < 3; ++i) {
                const float back = stats.speed * 4.0f * static_cast<float>(i + 1);
                const Engine::Vec2 trail{pos.x - std::cos(angle) * back, pos.y - std::sin(angle) * back};
                device_.drawFilledRect(trail, square(4.0f), color);
                angle -= stats.circleSpeed;
            }
            break;
        }
        case BehaviorKind::Zigzag:
            if (enemy.movementTicks() % 8 < 4) {
                const Engine::Vec2 center = pos + Engine::Vec2{Enemy::kSize / 2.0f, Enemy::kSize / 2.0f};
                device_.drawLine(center, center + Engine::Vec2{std::sin(behavior.phase()) * 8.0f, 0.0f}, color);
            }
            break;
        case BehaviorKind::Chase:
            break;
    }
}

void RenderSystem::drawLevelUp(const LevelUpChoice& choice) {
    const float w = static_cast<float>(device_.width());
    const float h = static_cast<float>(device_.height());
    device_.drawFilledRect(Engine::Vec2{0.0f, 0.0f}, Engine::Vec2{w, h}, Engine::paletteColor(kOverlayColor));

    const int count = static_cast<int>(choice.options.size());
    for (int i = 0; i < count; ++i) {
        const std::string label = levelUpOptionLabel(choice.options[static_cast<std::size_t>(i)]);
        const float textW = text_.measureText(label, 1.0f).x;
        const float x = std::floor((w - textW) / 2.0f);
        const float y = std::floor(h / 2.0f) - static_cast<float>(count * 4 - i * 8);
        text(label, x, y, i == choice.selected ? kSelectedColor : kOptionColor);
    }
}

void RenderSystem::drawHud(const Simulation& sim) {
    const Player& player = sim.player();
    text("HP: " + std::to_string(static_cast<int>(player.hp())), 4.0f, 4.0f, kHudColor);
    text("LEVEL: " + std::to_string(player.level()), 4.0f, 12.0f, kHudColor);
    text("EXP: " + std::to_string(player.exp()) + "/" + std::to_string(player.expToNextLevel()), 4.0f, 20.0f,
         kHudColor);
    text("SCORE: " + std::to_string(sim.score()), 4.0f, 28.0f, kHudColor);
    text("HI: " + std::to_string(sim.highScore()), 4.0f, 36.0f, kHudColor);
    text("ENEMIES: " + std::to_string(sim.enemies().size()), 4.0f, 44.0f, kHudColor);
}

}  // namespace Game

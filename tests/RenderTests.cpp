// Palette, bitmap font and the game render pass against a recording device.
#include <cassert>
#include <vector>

#include "../engine/audio/Synth.h"
#include "../engine/render/BitmapFont.h"
#include "../engine/render/BitmapTextRenderer.h"
#include "../engine/render/Color.h"
#include "../engine/render/RenderDevice.h"
#include "../game/Simulation.h"
#include "../game/render/RenderSystem.h"

using namespace Engine;

namespace {
struct RectCall {
    Vec2 pos;
    Vec2 size;
    Color color;
};

class RecordingDevice final : public RenderDevice {
public:
    void clear(const Color& /*color*/) override { ++clears; }
    void drawFilledRect(const Vec2& topLeft, const Vec2& size, const Color& color) override {
        rects.push_back(RectCall{topLeft, size, color});
    }
    void drawLine(const Vec2& /*from*/, const Vec2& /*to*/, const Color& /*color*/) override { ++lines; }
    void drawCircleOutline(const Vec2& /*center*/, float /*radius*/, const Color& /*color*/) override { ++circles; }
    void present() override {}
    int width() const override { return 160; }
    int height() const override { return 120; }

    void reset() {
        rects.clear();
        clears = lines = circles = 0;
    }

    std::vector<RectCall> rects;
    int clears{0};
    int lines{0};
    int circles{0};
};

bool sameColor(const Color& a, const Color& b) { return a.r == b.r && a.g == b.g && a.b == b.b && a.a == b.a; }
}  // namespace

int main() {
    {
        assert(palette().size() == 16);
        assert(sameColor(paletteColor(16), paletteColor(0)));
        assert(sameColor(paletteColor(-1), paletteColor(15)));
        assert(sameColor(paletteColor(7), palette()[7]));
    }
    {
        const BitmapFont& font = builtinFont();
        assert(font.glyphWidth == 3 && font.glyphHeight == 5 && font.advance == 4);
        assert(font.glyphs[0].bits == 0);       // space
        assert(font.glyphs['A' - 32].bits != 0);
        assert(font.glyphs['a' - 32].bits == font.glyphs['A' - 32].bits);
    }
    {
        RecordingDevice device;
        BitmapTextRenderer text(device);
        Vec2 size = text.measureText("AB", 1.0f);
        assert(size.x == 8.0f && size.y == 6.0f);
        size = text.measureText("AB\nC", 2.0f);
        assert(size.x == 16.0f && size.y == 24.0f);
        assert(text.measureText("", 1.0f).x == 0.0f);

        text.drawText("   ", Vec2{0.0f, 0.0f}, 1.0f, paletteColor(7));
        assert(device.rects.empty());
        text.drawText("8", Vec2{10.0f, 20.0f}, 2.0f, paletteColor(7));
        assert(!device.rects.empty());
        for (const auto& r : device.rects) {
            assert(r.size.x == 2.0f && r.size.y == 2.0f);
            assert(r.pos.x >= 10.0f && r.pos.x < 16.0f && r.pos.y >= 20.0f && r.pos.y < 30.0f);
        }
    }
    {
        Game::GameConfig cfg{};
        cfg.seed = 3;
        Game::Simulation sim(cfg);
        Audio::NullSynth synth;
        for (Game::EnemyKind kind : Game::kAllEnemyKinds) {
            sim.spawnEnemy(kind, Vec2{20.0f, 20.0f});
        }
        sim.player().addWeapon(Game::WeaponKind::SacredFlame);
        sim.player().addWeapon(Game::WeaponKind::MagicBlade);
        sim.update(ActionState{}, synth);

        RecordingDevice device;
        BitmapTextRenderer text(device);
        Game::RenderSystem renderer(device, text);
        renderer.draw(sim);
        assert(device.clears == 1);
        assert(device.lines >= 1);    // facing line
        assert(device.circles >= 2);  // sacred flame rings
        bool playerDrawn = false;
        for (const auto& r : device.rects) {
            if (r.pos.x == sim.player().position().x && r.pos.y == sim.player().position().y && r.size.x == 8.0f &&
                sameColor(r.color, paletteColor(7))) {
                playerDrawn = true;
            }
        }
        assert(playerDrawn);

        // No overlay while running.
        for (const auto& r : device.rects) {
            assert(!(r.size.x == 160.0f && r.size.y == 120.0f));
        }
    }
    {
        // Level-up overlay covers the screen before the option text.
        Game::GameConfig cfg{};
        cfg.seed = 5;
        Game::Simulation sim(cfg);
        Audio::NullSynth synth;
        sim.player().gainExp(9);
        sim.spawnEnemy(Game::EnemyKind::Zombie, sim.player().position()).takeDamage(50);
        sim.update(ActionState{}, synth);
        assert(sim.mode() == Game::SimMode::ChoosingLevelUp);

        RecordingDevice device;
        BitmapTextRenderer text(device);
        Game::RenderSystem renderer(device, text);
        renderer.draw(sim);
        bool overlay = false;
        bool highlighted = false;
        for (const auto& r : device.rects) {
            if (r.size.x == 160.0f && r.size.y == 120.0f && sameColor(r.color, paletteColor(1))) overlay = true;
            if (overlay && r.size.x == 1.0f && sameColor(r.color, paletteColor(7))) highlighted = true;
        }
        assert(overlay);
        assert(highlighted);
    }
    return 0;
}

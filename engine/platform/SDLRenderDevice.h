// SDL2 implementation of RenderDevice.
#pragma once

#include <SDL.h>

#include "../render/RenderDevice.h"

namespace Engine {

class SDLRenderDevice final : public RenderDevice {
public:
    SDLRenderDevice(SDL_Renderer* renderer, int logicalWidth, int logicalHeight);

    void clear(const Color& color) override;
    void drawFilledRect(const Vec2& topLeft, const Vec2& size, const Color& color) override;
    void drawLine(const Vec2& from, const Vec2& to, const Color& color) override;
    void drawCircleOutline(const Vec2& center, float radius, const Color& color) override;
    void present() override;

    int width() const override { return logicalWidth_; }
    int height() const override { return logicalHeight_; }

    SDL_Renderer* rawRenderer() const { return renderer_; }

private:
    void setDrawColor(const Color& color);

    SDL_Renderer* renderer_{nullptr};  // owned by SDLWindow
    int logicalWidth_{160};
    int logicalHeight_{120};
};

}  // namespace Engine

// No-op renderer used by NullWindow or headless runs.
#pragma once

#include "RenderDevice.h"

namespace Engine {

class NullRenderDevice final : public RenderDevice {
public:
    NullRenderDevice(int width = 160, int height = 120) : width_(width), height_(height) {}

    void clear(const Color& /*color*/) override {}
    void drawFilledRect(const Vec2& /*topLeft*/, const Vec2& /*size*/, const Color& /*color*/) override {}
    void drawLine(const Vec2& /*from*/, const Vec2& /*to*/, const Color& /*color*/) override {}
    void drawCircleOutline(const Vec2& /*center*/, float /*radius*/, const Color& /*color*/) override {}
    void present() override {}

    int width() const override { return width_; }
    int height() const override { return height_; }

private:
    int width_;
    int height_;
};

}  // namespace Engine

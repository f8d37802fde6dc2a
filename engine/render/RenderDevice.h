// Minimal immediate-mode 2D render device working in logical screen pixels.
#pragma once

#include <memory>

#include "../math/Vec2.h"
#include "Color.h"

namespace Engine {

class RenderDevice {
public:
    virtual ~RenderDevice() = default;

    virtual void clear(const Color& color) = 0;
    virtual void drawFilledRect(const Vec2& topLeft, const Vec2& size, const Color& color) = 0;
    virtual void drawLine(const Vec2& from, const Vec2& to, const Color& color) = 0;
    virtual void drawCircleOutline(const Vec2& center, float radius, const Color& color) = 0;
    virtual void present() = 0;

    // Logical screen size (160x120 unless the window was configured otherwise).
    virtual int width() const = 0;
    virtual int height() const = 0;
};

using RenderDevicePtr = std::unique_ptr<RenderDevice>;

}  // namespace Engine

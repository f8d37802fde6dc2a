// Bitmap font renderer using RenderDevice.
#pragma once

#include "TextRenderer.h"
#include "BitmapFont.h"
#include "RenderDevice.h"

namespace Engine {

class BitmapTextRenderer final : public TextRenderer {
public:
    explicit BitmapTextRenderer(RenderDevice& device, const BitmapFont& font = builtinFont())
        : device_(device), font_(font) {}

    void drawText(const std::string& text, const Vec2& topLeft, float scale, const Color& color) override;
    Vec2 measureText(const std::string& text, float scale) const override;

private:
    RenderDevice& device_;
    const BitmapFont& font_;
};

}  // namespace Engine

#include "BitmapTextRenderer.h"

#include <algorithm>

namespace Engine {

void BitmapTextRenderer::drawText(const std::string& text, const Vec2& topLeft, float scale, const Color& color) {
    Vec2 pen = topLeft;
    const Vec2 pixelSize{scale, scale};
    for (char c : text) {
        if (c == '\n') {
            pen.x = topLeft.x;
            pen.y += font_.lineHeight * scale;
            continue;
        }
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 32 || uc >= 128) continue;
        const Glyph& g = font_.glyphs[uc - 32];
        for (int row = 0; row < font_.glyphHeight; ++row) {
            for (int col = 0; col < font_.glyphWidth; ++col) {
                if (!g.pixel(col, row)) continue;
                device_.drawFilledRect(Vec2{pen.x + col * scale, pen.y + row * scale}, pixelSize, color);
            }
        }
        pen.x += font_.advance * scale;
    }
}

Vec2 BitmapTextRenderer::measureText(const std::string& text, float scale) const {
    if (text.empty()) return Vec2{0.0f, 0.0f};
    float maxW = 0.0f;
    float lineW = 0.0f;
    int lines = 1;
    for (char c : text) {
        if (c == '\n') {
            maxW = std::max(maxW, lineW);
            lineW = 0.0f;
            lines += 1;
            continue;
        }
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 32 || uc >= 128) continue;
        lineW += static_cast<float>(font_.advance) * scale;
    }
    maxW = std::max(maxW, lineW);
    const float h = static_cast<float>(font_.lineHeight) * scale * static_cast<float>(lines);
    return Vec2{maxW, h};
}

}  // namespace Engine

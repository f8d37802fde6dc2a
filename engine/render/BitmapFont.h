// Built-in 3x5 bitmap font; glyph pixels are drawn as filled rects so no texture is needed.
#pragma once

#include <array>
#include <cstdint>

namespace Engine {

// 15 bits, five rows of three columns, top row in the high bits, left column in the high bit of a row.
struct Glyph {
    std::uint16_t bits{0};

    bool pixel(int col, int row) const {
        const int shift = (4 - row) * 3 + (2 - col);
        return ((bits >> shift) & 1u) != 0;
    }
};

struct BitmapFont {
    std::array<Glyph, 96> glyphs{};  // ASCII 32-127
    int glyphWidth{3};
    int glyphHeight{5};
    int advance{4};
    int lineHeight{6};
};

const BitmapFont& builtinFont();

}  // namespace Engine

// Simple color helper plus the fixed 16-entry palette used by game content.
#pragma once

#include <array>

namespace Engine {

struct Color {
    unsigned char r{0};
    unsigned char g{0};
    unsigned char b{0};
    unsigned char a{255};
};

constexpr int kPaletteSize = 16;

inline const std::array<Color, kPaletteSize>& palette() {
    static const std::array<Color, kPaletteSize> colors{{
        {0x00, 0x00, 0x00, 255},  // 0 black
        {0x2b, 0x33, 0x5f, 255},  // 1 navy
        {0x7e, 0x20, 0x72, 255},  // 2 purple
        {0x19, 0x95, 0x9c, 255},  // 3 teal
        {0x8b, 0x48, 0x52, 255},  // 4 brown
        {0x39, 0x5c, 0x98, 255},  // 5 dark blue
        {0xa9, 0xc1, 0xff, 255},  // 6 light blue
        {0xee, 0xee, 0xee, 255},  // 7 white
        {0xd4, 0x18, 0x6c, 255},  // 8 red
        {0xd3, 0x84, 0x41, 255},  // 9 orange
        {0xe9, 0xc3, 0x5b, 255},  // 10 yellow
        {0x70, 0xc6, 0xa9, 255},  // 11 green
        {0x76, 0x96, 0xde, 255},  // 12 blue
        {0xa3, 0xa3, 0xa3, 255},  // 13 grey
        {0xff, 0x97, 0x98, 255},  // 14 pink
        {0xed, 0xc7, 0xb0, 255},  // 15 peach
    }};
    return colors;
}

// Out-of-range indices wrap around the palette.
inline Color paletteColor(int index) {
    const int wrapped = ((index % kPaletteSize) + kPaletteSize) % kPaletteSize;
    return palette()[static_cast<std::size_t>(wrapped)];
}

}  // namespace Engine

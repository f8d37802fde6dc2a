#include "BitmapFont.h"

namespace Engine {

namespace {

// ASCII 32 (' ') through 95 ('_').
constexpr std::array<std::uint16_t, 64> kBaseGlyphs{{
    0b000'000'000'000'000,  // space
    0b010'010'010'000'010,  // !
    0b101'101'000'000'000,  // "
    0b101'111'101'111'101,  // #
    0b011'110'010'011'110,  // $
    0b101'001'010'100'101,  // %
    0b010'101'010'101'011,  // &
    0b010'010'000'000'000,  // '
    0b001'010'010'010'001,  // (
    0b100'010'010'010'100,  // )
    0b000'101'010'101'000,  // *
    0b000'010'111'010'000,  // +
    0b000'000'000'010'100,  // ,
    0b000'000'111'000'000,  // -
    0b000'000'000'000'010,  // .
    0b001'001'010'100'100,  // /
    0b111'101'101'101'111,  // 0
    0b010'110'010'010'111,  // 1
    0b111'001'111'100'111,  // 2
    0b111'001'111'001'111,  // 3
    0b101'101'111'001'001,  // 4
    0b111'100'111'001'111,  // 5
    0b111'100'111'101'111,  // 6
    0b111'001'001'001'001,  // 7
    0b111'101'111'101'111,  // 8
    0b111'101'111'001'111,  // 9
    0b000'010'000'010'000,  // :
    0b000'010'000'010'100,  // ;
    0b001'010'100'010'001,  // <
    0b000'111'000'111'000,  // =
    0b100'010'001'010'100,  // >
    0b111'001'010'000'010,  // ?
    0b010'101'111'100'011,  // @
    0b010'101'111'101'101,  // A
    0b110'101'110'101'110,  // B
    0b011'100'100'100'011,  // C
    0b110'101'101'101'110,  // D
    0b111'100'111'100'111,  // E
    0b111'100'111'100'100,  // F
    0b011'100'101'101'011,  // G
    0b101'101'111'101'101,  // H
    0b111'010'010'010'111,  // I
    0b001'001'001'101'010,  // J
    0b101'101'110'101'101,  // K
    0b100'100'100'100'111,  // L
    0b101'111'111'101'101,  // M
    0b110'101'101'101'101,  // N
    0b010'101'101'101'010,  // O
    0b110'101'110'100'100,  // P
    0b010'101'101'110'011,  // Q
    0b110'101'110'101'101,  // R
    0b011'100'010'001'110,  // S
    0b111'010'010'010'010,  // T
    0b101'101'101'101'011,  // U
    0b101'101'101'010'010,  // V
    0b101'101'111'111'101,  // W
    0b101'101'010'101'101,  // X
    0b101'101'010'010'010,  // Y
    0b111'001'010'100'111,  // Z
    0b011'010'010'010'011,  // [
    0b100'100'010'001'001,  // backslash
    0b110'010'010'010'110,  // ]
    0b010'101'000'000'000,  // ^
    0b000'000'000'000'111,  // _
}};

BitmapFont buildFont() {
    BitmapFont font{};
    for (std::size_t i = 0; i < kBaseGlyphs.size(); ++i) {
        font.glyphs[i].bits = kBaseGlyphs[i];
    }
    // Lowercase letters reuse the uppercase shapes.
    for (char c = 'a'; c <= 'z'; ++c) {
        font.glyphs[static_cast<std::size_t>(c - 32)] = font.glyphs[static_cast<std::size_t>(c - 'a' + 'A' - 32)];
    }
    font.glyphs['`' - 32].bits = 0b100'010'000'000'000;
    font.glyphs['{' - 32].bits = 0b011'010'110'010'011;
    font.glyphs['|' - 32].bits = 0b010'010'010'010'010;
    font.glyphs['}' - 32].bits = 0b110'010'011'010'110;
    font.glyphs['~' - 32].bits = 0b000'001'111'100'000;
    return font;
}

}  // namespace

const BitmapFont& builtinFont() {
    static const BitmapFont font = buildFont();
    return font;
}

}  // namespace Engine

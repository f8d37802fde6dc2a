// Axis-aligned rectangle overlap used for every hit test in the game.
#pragma once

#include "../math/Vec2.h"

namespace Engine::Gameplay {

struct Rect {
    float x{0.0f};
    float y{0.0f};
    float w{0.0f};
    float h{0.0f};
};

inline Rect rectAt(const Vec2& pos, float w, float h) { return Rect{pos.x, pos.y, w, h}; }

// Inclusive on all edges: rectangles that only touch are reported as overlapping.
inline bool rectsOverlap(const Rect& a, const Rect& b) {
    return a.x <= b.x + b.w && a.x + a.w >= b.x && a.y <= b.y + b.h && a.y + a.h >= b.y;
}

}  // namespace Engine::Gameplay

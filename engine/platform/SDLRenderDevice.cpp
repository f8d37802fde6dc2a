#include "SDLRenderDevice.h"

#include <cmath>
#include <vector>

#include <SDL.h>

namespace Engine {

SDLRenderDevice::SDLRenderDevice(SDL_Renderer* renderer, int logicalWidth, int logicalHeight)
    : renderer_(renderer), logicalWidth_(logicalWidth), logicalHeight_(logicalHeight) {}

void SDLRenderDevice::setDrawColor(const Color& color) {
    SDL_SetRenderDrawBlendMode(renderer_, color.a < 255 ? SDL_BLENDMODE_BLEND : SDL_BLENDMODE_NONE);
    SDL_SetRenderDrawColor(renderer_, color.r, color.g, color.b, color.a);
}

void SDLRenderDevice::clear(const Color& color) {
    SDL_SetRenderDrawColor(renderer_, color.r, color.g, color.b, color.a);
    SDL_RenderClear(renderer_);
}

void SDLRenderDevice::drawFilledRect(const Vec2& topLeft, const Vec2& size, const Color& color) {
    SDL_Rect rect{};
    rect.x = static_cast<int>(std::floor(topLeft.x));
    rect.y = static_cast<int>(std::floor(topLeft.y));
    rect.w = static_cast<int>(size.x);
    rect.h = static_cast<int>(size.y);
    setDrawColor(color);
    SDL_RenderFillRect(renderer_, &rect);
}

void SDLRenderDevice::drawLine(const Vec2& from, const Vec2& to, const Color& color) {
    setDrawColor(color);
    SDL_RenderDrawLine(renderer_, static_cast<int>(std::floor(from.x)), static_cast<int>(std::floor(from.y)),
                       static_cast<int>(std::floor(to.x)), static_cast<int>(std::floor(to.y)));
}

void SDLRenderDevice::drawCircleOutline(const Vec2& center, float radius, const Color& color) {
    const int cx = static_cast<int>(std::floor(center.x));
    const int cy = static_cast<int>(std::floor(center.y));
    const int r = static_cast<int>(radius);
    if (r <= 0) {
        setDrawColor(color);
        SDL_RenderDrawPoint(renderer_, cx, cy);
        return;
    }

    // Midpoint circle, eight octants per step.
    std::vector<SDL_Point> points;
    points.reserve(static_cast<std::size_t>(r) * 8);
    int x = r;
    int y = 0;
    int err = 1 - r;
    while (x >= y) {
        points.push_back({cx + x, cy + y});
        points.push_back({cx + y, cy + x});
        points.push_back({cx - y, cy + x});
        points.push_back({cx - x, cy + y});
        points.push_back({cx - x, cy - y});
        points.push_back({cx - y, cy - x});
        points.push_back({cx + y, cy - x});
        points.push_back({cx + x, cy - y});
        ++y;
        if (err < 0) {
            err += 2 * y + 1;
        } else {
            --x;
            err += 2 * (y - x) + 1;
        }
    }
    setDrawColor(color);
    SDL_RenderDrawPoints(renderer_, points.data(), static_cast<int>(points.size()));
}

void SDLRenderDevice::present() { SDL_RenderPresent(renderer_); }

}  // namespace Engine

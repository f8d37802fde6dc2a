#include "SDLWindow.h"

#include <algorithm>
#include <string>
#include <vector>

#include <SDL.h>

#include "../core/Application.h"
#include "../core/Logger.h"
#include "SDLRenderDevice.h"

namespace Engine {

SDLWindow::SDLWindow() = default;

SDLWindow::~SDLWindow() {
    if (renderer_) {
        SDL_DestroyRenderer(renderer_);
    }
    if (window_) {
        SDL_DestroyWindow(window_);
    }
    // Audio has its own lifetime; only release what initialize() started.
    SDL_QuitSubSystem(SDL_INIT_VIDEO | SDL_INIT_EVENTS | SDL_INIT_TIMER);
}

bool SDLWindow::initialize(const WindowConfig& config) {
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS | SDL_INIT_TIMER) != 0) {
        logError(std::string("SDL_Init failed: ") + SDL_GetError());
        return false;
    }

    logicalWidth_ = config.logicalWidth;
    logicalHeight_ = config.logicalHeight;
    const int scale = std::max(1, config.scale);

    Uint32 windowFlags = SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE;
    window_ = SDL_CreateWindow(config.title.c_str(), SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                               logicalWidth_ * scale, logicalHeight_ * scale, windowFlags);
    if (!window_) {
        logError(std::string("SDL_CreateWindow failed: ") + SDL_GetError());
        return false;
    }

    const auto rendererFlags = config.vsync ? SDL_RENDERER_PRESENTVSYNC : 0;
    renderer_ = SDL_CreateRenderer(window_, -1, SDL_RENDERER_ACCELERATED | rendererFlags);
    if (!renderer_) {
        logError(std::string("SDL_CreateRenderer failed: ") + SDL_GetError());
        return false;
    }

    // Game code draws in logical pixels; SDL scales to the window.
    if (SDL_RenderSetLogicalSize(renderer_, logicalWidth_, logicalHeight_) != 0) {
        logWarn(std::string("SDL_RenderSetLogicalSize failed: ") + SDL_GetError());
    }
    SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "0");

    applyBindings(config.bindings);

    isOpen_ = true;
    logInfo("SDLWindow initialized.");
    return true;
}

void SDLWindow::applyBindings(const InputBindings& bindings) {
    keyMap_.clear();
    auto bind = [this](const std::vector<std::string>& names, InputKey key) {
        for (const auto& name : names) {
            const SDL_Keycode code = SDL_GetKeyFromName(name.c_str());
            if (code == SDLK_UNKNOWN) {
                logWarn("Unknown key name in bindings: " + name);
                continue;
            }
            keyMap_[code] = key;
        }
    };
    bind(bindings.up, InputKey::Up);
    bind(bindings.down, InputKey::Down);
    bind(bindings.left, InputKey::Left);
    bind(bindings.right, InputKey::Right);
    bind(bindings.confirm, InputKey::Confirm);
    bind(bindings.cancel, InputKey::Cancel);
}

std::unique_ptr<RenderDevice> SDLWindow::createRenderDevice() {
    if (!renderer_) {
        return nullptr;
    }
    return std::make_unique<SDLRenderDevice>(renderer_, logicalWidth_, logicalHeight_);
}

void SDLWindow::pollEvents(Application& app, InputState& input) {
    SDL_Event evt;
    while (SDL_PollEvent(&evt)) {
        switch (evt.type) {
            case SDL_QUIT:
                isOpen_ = false;
                app.requestQuit("Window close requested.");
                break;
            case SDL_KEYDOWN:
            case SDL_KEYUP: {
                if (evt.key.repeat != 0) break;
                const auto it = keyMap_.find(evt.key.keysym.sym);
                if (it != keyMap_.end()) {
                    input.setKeyDown(it->second, evt.type == SDL_KEYDOWN);
                }
                break;
            }
            default:
                break;
        }
    }
}

void SDLWindow::swapBuffers() {
    // Present is driven by RenderDevice::present; no-op here to avoid double clear/present.
}

}  // namespace Engine

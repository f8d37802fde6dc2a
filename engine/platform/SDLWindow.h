// SDL2-backed window implementation.
#pragma once

#include <unordered_map>

#include <SDL.h>

#include "Window.h"
#include "../input/InputState.h"

namespace Engine {

class SDLWindow final : public Window {
public:
    SDLWindow();
    ~SDLWindow() override;

    bool initialize(const WindowConfig& config) override;
    std::unique_ptr<class RenderDevice> createRenderDevice() override;
    void pollEvents(Application& app, class InputState& input) override;
    void swapBuffers() override;
    bool isOpen() const override { return isOpen_; }

private:
    void applyBindings(const InputBindings& bindings);

    SDL_Window* window_{nullptr};
    SDL_Renderer* renderer_{nullptr};
    int logicalWidth_{160};
    int logicalHeight_{120};
    bool isOpen_{false};
    std::unordered_map<SDL_Keycode, InputKey> keyMap_{};
};

}  // namespace Engine

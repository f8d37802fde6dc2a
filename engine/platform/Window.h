// Abstract window interface; real implementations live under /engine/platform.
#pragma once

#include <memory>
#include <string>

#include "../input/InputBinding.h"

namespace Engine {

struct WindowConfig {
    int logicalWidth{160};
    int logicalHeight{120};
    int scale{4};  // window pixels per logical pixel
    std::string title{"Beat Survivor"};
    bool vsync{true};
    InputBindings bindings{};
};

class Application;

class Window {
public:
    virtual ~Window() = default;

    virtual bool initialize(const WindowConfig& config) = 0;
    virtual void pollEvents(Application& app, class InputState& input) = 0;
    virtual std::unique_ptr<class RenderDevice> createRenderDevice() = 0;
    virtual void swapBuffers() = 0;
    virtual bool isOpen() const = 0;
};

using WindowPtr = std::unique_ptr<Window>;

}  // namespace Engine

// Headless window: runs a fixed number of frames, then requests shutdown.
#pragma once

#include "Window.h"

namespace Engine {

class NullWindow final : public Window {
public:
    explicit NullWindow(int maxFrames = 1) : maxFrames_(maxFrames) {}

    bool initialize(const WindowConfig& config) override;
    std::unique_ptr<class RenderDevice> createRenderDevice() override;
    void pollEvents(Application& app, class InputState& input) override;
    void swapBuffers() override;
    bool isOpen() const override { return isOpen_; }

    int framesPolled() const { return framesPolled_; }

private:
    int maxFrames_;
    int framesPolled_{0};
    int logicalWidth_{160};
    int logicalHeight_{120};
    bool isOpen_{false};
};

}  // namespace Engine

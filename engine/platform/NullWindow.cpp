#include "NullWindow.h"

#include <string>

#include "../core/Application.h"
#include "../core/Logger.h"
#include "../render/NullRenderDevice.h"

namespace Engine {

bool NullWindow::initialize(const WindowConfig& config) {
    isOpen_ = true;
    logicalWidth_ = config.logicalWidth;
    logicalHeight_ = config.logicalHeight;
    logWarn("NullWindow active; running headless for " + std::to_string(maxFrames_) + " frame(s).");
    logInfo("Requested window: " + config.title + " (" + std::to_string(config.logicalWidth) + "x" +
            std::to_string(config.logicalHeight) + ")");
    return true;
}

std::unique_ptr<RenderDevice> NullWindow::createRenderDevice() {
    return std::make_unique<NullRenderDevice>(logicalWidth_, logicalHeight_);
}

void NullWindow::pollEvents(Application& app, InputState& /*input*/) {
    if (!isOpen_) {
        return;
    }
    ++framesPolled_;
    if (framesPolled_ >= maxFrames_) {
        isOpen_ = false;
        app.requestQuit("NullWindow frame budget reached.");
    }
}

void NullWindow::swapBuffers() {
    // Nothing to do for the null backend.
}

}  // namespace Engine

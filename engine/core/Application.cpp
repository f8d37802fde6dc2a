#include "Application.h"

#include <chrono>
#include <thread>

#include "Logger.h"

namespace Engine {

Application::Application(ApplicationListener& listener, WindowPtr window, WindowConfig config)
    : listener_(listener), window_(std::move(window)), config_(std::move(config)) {}

Application::~Application() {
    if (initialized_) {
        listener_.onShutdown();
    }
}

bool Application::initialize() {
    if (!window_) {
        logError("Application requires a Window instance.");
        return false;
    }

    if (!window_->initialize(config_)) {
        logError("Failed to initialize window.");
        return false;
    }

    renderDevice_ = window_->createRenderDevice();
    if (!renderDevice_) {
        logError("Failed to create render device.");
        return false;
    }

    initialized_ = true;
    running_ = listener_.onInitialize(*this);
    return running_;
}

bool Application::stepFrame() {
    if (!running_ || !window_->isOpen()) {
        return false;
    }
    window_->pollEvents(*this, input_);
    listener_.onUpdate(timeStep_, input_);
    listener_.onRender();
    input_.nextFrame();
    window_->swapBuffers();
    renderDevice_->present();

    timeStep_.elapsedSeconds += timeStep_.deltaSeconds;
    ++timeStep_.tick;
    return running_;
}

void Application::run() {
    using clock = std::chrono::steady_clock;
    const auto frameBudget = std::chrono::duration<double>(kFixedDeltaSeconds);

    while (running_ && window_->isOpen()) {
        const auto frameStart = clock::now();
        stepFrame();

        // One simulation tick per frame; pace the loop to the fixed rate.
        const std::chrono::duration<double> spent = clock::now() - frameStart;
        if (spent < frameBudget) {
            std::this_thread::sleep_for(frameBudget - spent);
        }
    }

    logInfo("Application loop exited.");
}

void Application::requestQuit(const std::string& reason) {
    if (!running_) {
        return;
    }
    running_ = false;
    logInfo("Shutdown requested: " + reason);
}

}  // namespace Engine

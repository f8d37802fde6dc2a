// Time structures used by the main loop.
#pragma once

#include <cstdint>

namespace Engine {

// Every frame-count constant in the game assumes this rate.
constexpr int kTicksPerSecond = 60;
constexpr double kFixedDeltaSeconds = 1.0 / kTicksPerSecond;

struct TimeStep {
    double deltaSeconds{kFixedDeltaSeconds};
    double elapsedSeconds{0.0};
    std::uint64_t tick{0};
};

}  // namespace Engine

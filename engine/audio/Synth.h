// Fire-and-forget sample playback capability consumed by game code.
#pragma once

#include <string>

namespace Engine::Audio {

class Synth {
public:
    virtual ~Synth() = default;

    // Starts the named sample on a channel; a sample already playing there is replaced.
    virtual void trigger(int channel, const std::string& sample) = 0;
};

class NullSynth final : public Synth {
public:
    void trigger(int /*channel*/, const std::string& /*sample*/) override {}
};

}  // namespace Engine::Audio

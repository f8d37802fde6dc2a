// Synth backed by SDL2_mixer; samples are rendered from ToneSpecs at registration time.
#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "Synth.h"
#include "Tone.h"

namespace Engine::Audio {

class ToneSynth final : public Synth {
public:
    explicit ToneSynth(int channelCount = 4) : channelCount_(channelCount) {}
    ~ToneSynth() override;

    ToneSynth(const ToneSynth&) = delete;
    ToneSynth& operator=(const ToneSynth&) = delete;

    bool initialize();
    void shutdown();

    bool registerTone(const std::string& name, const ToneSpec& tone);
    void trigger(int channel, const std::string& sample) override;

    void setVolume(float volume01);
    float volume() const { return volume01_; }

    bool isInitialized() const { return initialized_; }

private:
    struct ChunkSlot {
        std::vector<std::int16_t> pcm;  // must outlive handle; the chunk points into it
        void* handle{nullptr};
    };

    void freeAll();

    int channelCount_;
    bool initialized_{false};
    bool warnedMissing_{false};
    float volume01_{0.6f};
    std::unordered_map<std::string, ChunkSlot> chunks_{};
};

}  // namespace Engine::Audio

#include "ToneSynth.h"

#include "AudioBackend.h"
#include "../core/Logger.h"

#include <algorithm>
#include <utility>

#if defined(BEAT_HAS_SDL_MIXER) && (BEAT_HAS_SDL_MIXER == 1)
#    include <SDL_mixer.h>
#endif

namespace Engine::Audio {

ToneSynth::~ToneSynth() { shutdown(); }

bool ToneSynth::initialize() {
    if (initialized_) return true;
    if (!acquireBackend(channelCount_)) {
        initialized_ = false;
        return false;
    }
    initialized_ = true;
    return true;
}

void ToneSynth::freeAll() {
#if defined(BEAT_HAS_SDL_MIXER) && (BEAT_HAS_SDL_MIXER == 1)
    for (auto& kv : chunks_) {
        if (kv.second.handle) {
            Mix_FreeChunk(static_cast<Mix_Chunk*>(kv.second.handle));
        }
    }
#endif
    chunks_.clear();
}

void ToneSynth::shutdown() {
    if (!initialized_) {
        freeAll();
        return;
    }
#if defined(BEAT_HAS_SDL_MIXER) && (BEAT_HAS_SDL_MIXER == 1)
    Mix_HaltChannel(-1);
#endif
    freeAll();
    releaseBackend();
    initialized_ = false;
}

void ToneSynth::setVolume(float volume01) {
    volume01_ = std::clamp(volume01, 0.0f, 1.0f);
#if defined(BEAT_HAS_SDL_MIXER) && (BEAT_HAS_SDL_MIXER == 1)
    for (auto& kv : chunks_) {
        if (kv.second.handle) {
            Mix_VolumeChunk(static_cast<Mix_Chunk*>(kv.second.handle), static_cast<int>(volume01_ * 128.0f));
        }
    }
#endif
}

bool ToneSynth::registerTone(const std::string& name, const ToneSpec& tone) {
#if defined(BEAT_HAS_SDL_MIXER) && (BEAT_HAS_SDL_MIXER == 1)
    if (!initialized_) return false;
    const BackendFormat fmt = backendFormat();
    ChunkSlot slot{};
    slot.pcm = renderTone(tone, fmt.frequency, fmt.channels);
    if (slot.pcm.empty()) {
        logWarn("Tone '" + name + "' rendered no samples.");
        return false;
    }

    auto it = chunks_.find(name);
    if (it != chunks_.end()) {
        if (it->second.handle) Mix_FreeChunk(static_cast<Mix_Chunk*>(it->second.handle));
        chunks_.erase(it);
    }
    auto [insIt, inserted] = chunks_.emplace(name, std::move(slot));
    (void)inserted;
    auto& stored = insIt->second;
    Mix_Chunk* chunk = Mix_QuickLoad_RAW(reinterpret_cast<Uint8*>(stored.pcm.data()),
                                         static_cast<Uint32>(stored.pcm.size() * sizeof(std::int16_t)));
    if (!chunk) {
        logWarn(std::string("Mix_QuickLoad_RAW failed for ") + name + ": " + Mix_GetError());
        chunks_.erase(insIt);
        return false;
    }
    Mix_VolumeChunk(chunk, static_cast<int>(volume01_ * 128.0f));
    stored.handle = chunk;
    return true;
#else
    (void)name;
    (void)tone;
    return false;
#endif
}

void ToneSynth::trigger(int channel, const std::string& sample) {
#if defined(BEAT_HAS_SDL_MIXER) && (BEAT_HAS_SDL_MIXER == 1)
    if (!initialized_) return;
    if (channel < 0 || channel >= channelCount_) return;
    auto it = chunks_.find(sample);
    if (it == chunks_.end() || !it->second.handle) {
        if (!warnedMissing_) {
            logWarn("Synth sample not registered: " + sample);
            warnedMissing_ = true;
        }
        return;
    }
    // Playing on an explicit channel halts whatever that channel was playing.
    if (Mix_PlayChannel(channel, static_cast<Mix_Chunk*>(it->second.handle), 0) == -1) {
        logDebug(std::string("Mix_PlayChannel failed: ") + Mix_GetError());
    }
#else
    (void)channel;
    (void)sample;
#endif
}

}  // namespace Engine::Audio

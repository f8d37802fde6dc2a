#include "AudioBackend.h"

#include <string>

#include "../core/Logger.h"

#if defined(BEAT_HAS_SDL_MIXER) && (BEAT_HAS_SDL_MIXER == 1)
#    include <SDL.h>
#    include <SDL_mixer.h>
#endif

namespace Engine::Audio {

namespace {
int gRefCount = 0;
BackendFormat gFormat{};
#if !defined(BEAT_HAS_SDL_MIXER) || (BEAT_HAS_SDL_MIXER != 1)
bool gWarnedNoBackend = false;
#endif
}  // namespace

bool backendAvailable() {
#if defined(BEAT_HAS_SDL_MIXER) && (BEAT_HAS_SDL_MIXER == 1)
    return true;
#else
    return false;
#endif
}

BackendFormat backendFormat() { return gFormat; }

bool acquireBackend(int mixChannels) {
#if defined(BEAT_HAS_SDL_MIXER) && (BEAT_HAS_SDL_MIXER == 1)
    if (gRefCount++ > 0) {
        return true;
    }

    if (SDL_InitSubSystem(SDL_INIT_AUDIO) != 0) {
        logError(std::string("SDL audio init failed: ") + SDL_GetError());
        gRefCount = 0;
        return false;
    }

    // Tones are rendered in memory, so no decoder flags are needed for Mix_Init.
    if (Mix_OpenAudio(44100, MIX_DEFAULT_FORMAT, 2, 1024) != 0) {
        logError(std::string("Mix_OpenAudio failed: ") + Mix_GetError());
        SDL_QuitSubSystem(SDL_INIT_AUDIO);
        gRefCount = 0;
        return false;
    }

    int frequency = 0;
    Uint16 format = 0;
    int channels = 0;
    if (Mix_QuerySpec(&frequency, &format, &channels) == 0) {
        logWarn(std::string("Mix_QuerySpec failed: ") + Mix_GetError());
    } else {
        gFormat.frequency = frequency;
        gFormat.channels = channels;
        if (format != AUDIO_S16SYS) {
            logWarn("Audio device opened with a non-S16 format; tones may sound distorted.");
        }
    }
    Mix_AllocateChannels(mixChannels);
    return true;
#else
    (void)mixChannels;
    if (!gWarnedNoBackend) {
        logWarn("Audio disabled: SDL2_mixer not found at build time.");
        gWarnedNoBackend = true;
    }
    return false;
#endif
}

void releaseBackend() {
#if defined(BEAT_HAS_SDL_MIXER) && (BEAT_HAS_SDL_MIXER == 1)
    if (gRefCount <= 0) {
        gRefCount = 0;
        return;
    }
    gRefCount -= 1;
    if (gRefCount == 0) {
        Mix_HaltChannel(-1);
        Mix_CloseAudio();
        Mix_Quit();
        SDL_QuitSubSystem(SDL_INIT_AUDIO);
    }
#else
    // no-op
#endif
}

}  // namespace Engine::Audio

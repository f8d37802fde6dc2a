// Shared SDL_mixer backend with simple ref-counted lifetime.
#pragma once

namespace Engine::Audio {

struct BackendFormat {
    int frequency{44100};
    int channels{2};
};

// Returns true if SDL2_mixer backend is available and initialized.
bool acquireBackend(int mixChannels);

// Releases one reference; when it reaches zero the backend is torn down.
void releaseBackend();

bool backendAvailable();

// Output format negotiated with the device; only meaningful while acquired.
BackendFormat backendFormat();

}  // namespace Engine::Audio

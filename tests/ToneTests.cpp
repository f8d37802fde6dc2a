// Note-string parsing and PCM rendering for the procedural synth.
#include <cassert>
#include <cmath>

#include "../engine/audio/Tone.h"

using namespace Engine::Audio;

int main() {
    {
        auto notes = parseNotes("c2e2g2c3");
        assert(notes && notes->size() == 4);
        assert((*notes)[0] < (*notes)[1] && (*notes)[1] < (*notes)[2] && (*notes)[2] < (*notes)[3]);
        assert(std::fabs((*notes)[3] - 2.0f * (*notes)[0]) < 0.01f);

        auto a4 = parseNotes("a4");
        assert(a4 && std::fabs((*a4)[0] - 440.0f) < 0.01f);
        auto sharp = parseNotes("c#2");
        auto flat = parseNotes("d-2");
        assert(sharp && flat && std::fabs((*sharp)[0] - (*flat)[0]) < 0.001f);
        assert(parseNotes("C3").has_value());
    }
    {
        assert(!parseNotes("").has_value());
        assert(!parseNotes("x1").has_value());
        assert(!parseNotes("c5").has_value());
        assert(!parseNotes("c").has_value());
        assert(!parseNotes("c2e").has_value());
    }
    {
        ToneSpec tone;
        tone.frequencies = {220.0f, 330.0f};
        tone.noteSeconds = 0.1f;
        auto pcm = renderTone(tone, 1000, 2);
        assert(pcm.size() == 400);
        // Stereo frames carry the same value on both channels.
        for (std::size_t i = 0; i + 1 < pcm.size(); i += 2) assert(pcm[i] == pcm[i + 1]);
        bool nonZero = false;
        for (auto s : pcm) nonZero = nonZero || s != 0;
        assert(nonZero);
    }
    {
        ToneSpec silent;
        silent.frequencies = {440.0f};
        silent.volume = 0.0f;
        for (auto s : renderTone(silent, 8000, 1)) assert(s == 0);

        ToneSpec empty;
        assert(renderTone(empty, 44100, 2).empty());
        ToneSpec noise;
        noise.wave = Waveform::Noise;
        noise.frequencies = {100.0f};
        assert(renderTone(noise, 0, 2).empty());
        assert(renderTone(noise, 8000, 1) == renderTone(noise, 8000, 1));
    }
    return 0;
}

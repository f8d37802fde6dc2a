#include "Tone.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>

namespace Engine::Audio {

namespace {
int semitoneForLetter(char letter) {
    switch (letter) {
        case 'c': return 0;
        case 'd': return 2;
        case 'e': return 4;
        case 'f': return 5;
        case 'g': return 7;
        case 'a': return 9;
        case 'b': return 11;
        default: return -1;
    }
}

float oscillator(Waveform wave, float phase01, std::uint32_t& noiseState) {
    switch (wave) {
        case Waveform::Triangle:
            return 1.0f - 4.0f * std::abs(phase01 - 0.5f);
        case Waveform::Square:
            return phase01 < 0.5f ? 1.0f : -1.0f;
        case Waveform::Pulse:
            return phase01 < 0.25f ? 1.0f : -1.0f;
        case Waveform::Noise:
        default:
            // xorshift32; deterministic so identical specs render identical buffers.
            noiseState ^= noiseState << 13;
            noiseState ^= noiseState >> 17;
            noiseState ^= noiseState << 5;
            return static_cast<float>(noiseState & 0xFFFFu) / 32767.5f - 1.0f;
    }
}
}  // namespace

float noteFrequency(int semitoneFromC0) {
    // A4 = 440 Hz is 57 semitones above C0.
    return 440.0f * std::pow(2.0f, static_cast<float>(semitoneFromC0 - 57) / 12.0f);
}

std::optional<std::vector<float>> parseNotes(std::string_view notes) {
    std::vector<float> out;
    std::size_t i = 0;
    while (i < notes.size()) {
        const char letter = static_cast<char>(std::tolower(static_cast<unsigned char>(notes[i])));
        const int base = semitoneForLetter(letter);
        if (base < 0) return std::nullopt;
        ++i;
        int accidental = 0;
        if (i < notes.size() && (notes[i] == '#' || notes[i] == '-')) {
            accidental = notes[i] == '#' ? 1 : -1;
            ++i;
        }
        if (i >= notes.size() || notes[i] < '0' || notes[i] > '4') return std::nullopt;
        const int octave = notes[i] - '0';
        ++i;
        out.push_back(noteFrequency(octave * 12 + base + accidental));
    }
    if (out.empty()) return std::nullopt;
    return out;
}

std::vector<std::int16_t> renderTone(const ToneSpec& tone, int sampleRate, int channels) {
    std::vector<std::int16_t> pcm;
    if (sampleRate <= 0 || channels <= 0 || tone.frequencies.empty() || tone.noteSeconds <= 0.0f) {
        return pcm;
    }
    const auto framesPerNote = static_cast<std::size_t>(tone.noteSeconds * static_cast<float>(sampleRate));
    const std::size_t totalFrames = framesPerNote * tone.frequencies.size();
    pcm.reserve(totalFrames * static_cast<std::size_t>(channels));

    const float amplitude = std::clamp(tone.volume, 0.0f, 1.0f) * 32767.0f;
    std::uint32_t noiseState = 0x9E3779B9u;
    float phase = 0.0f;
    std::size_t frame = 0;
    for (float freq : tone.frequencies) {
        const float step = freq / static_cast<float>(sampleRate);
        for (std::size_t n = 0; n < framesPerNote; ++n, ++frame) {
            float env = 1.0f;
            if (tone.fadeOut) {
                env = 1.0f - static_cast<float>(frame) / static_cast<float>(totalFrames);
            }
            // Short ramp at each note edge avoids clicks.
            const std::size_t edge = std::min(n, framesPerNote - 1 - n);
            if (edge < 64) env *= static_cast<float>(edge) / 64.0f;

            const float value = oscillator(tone.wave, phase, noiseState) * amplitude * env;
            const auto sample = static_cast<std::int16_t>(std::clamp(value, -32767.0f, 32767.0f));
            for (int c = 0; c < channels; ++c) {
                pcm.push_back(sample);
            }
            phase += step;
            phase -= std::floor(phase);
        }
    }
    return pcm;
}

}  // namespace Engine::Audio

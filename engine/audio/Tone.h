// Procedural tone description and PCM rendering for the synth backend.
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace Engine::Audio {

enum class Waveform { Triangle, Square, Pulse, Noise };

struct ToneSpec {
    Waveform wave{Waveform::Triangle};
    std::vector<float> frequencies;  // one entry per note, played back to back
    float noteSeconds{0.1f};
    float volume{0.5f};  // 0..1
    bool fadeOut{false};
};

// Parses note strings such as "c2e2g2c3" or "a2c#3" into frequencies in Hz.
// Notes are a letter a-g, an optional '#' or '-' (flat) and an octave digit 0-4.
std::optional<std::vector<float>> parseNotes(std::string_view notes);

float noteFrequency(int semitoneFromC0);

// Renders interleaved signed 16-bit samples for the given channel count.
std::vector<std::int16_t> renderTone(const ToneSpec& tone, int sampleRate, int channels);

}  // namespace Engine::Audio

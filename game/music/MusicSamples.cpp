#include "MusicSamples.h"

#include <array>

#include "../../engine/core/Logger.h"

namespace Game {

namespace {
constexpr std::array<const char*, 4> kInstrumentNames{"bass", "lead", "pad", "drum"};
constexpr std::array<const char*, 3> kAmbientNotes{"c2e2g2c3", "g2b2d3g3", "c3e3g3c4"};

// Melody roots sit at C3; rhythm voices spread across octaves 2..4.
constexpr int kMelodyRoot = 36;
constexpr int kRhythmRoot = 24;
constexpr int kRhythmValues = 4;

Engine::Audio::Waveform waveFor(int instrument) {
    switch (instrument) {
        case 0: return Engine::Audio::Waveform::Triangle;
        case 1: return Engine::Audio::Waveform::Pulse;
        case 2: return Engine::Audio::Waveform::Square;
        default: return Engine::Audio::Waveform::Noise;
    }
}
}  // namespace

std::string melodySampleName(int semitone) { return "note_" + std::to_string(semitone); }

std::string rhythmSampleName(int instrument, int value) {
    const char* voice = (instrument >= 0 && instrument < static_cast<int>(kInstrumentNames.size()))
                            ? kInstrumentNames[static_cast<std::size_t>(instrument)]
                            : "drum";
    return std::string(voice) + "_" + std::to_string(value);
}

std::string ambientSampleName(int variant) { return "ambient_" + std::to_string(variant); }

std::vector<std::pair<std::string, Engine::Audio::ToneSpec>> musicSampleBank(float volume01) {
    std::vector<std::pair<std::string, Engine::Audio::ToneSpec>> bank;

    for (int semitone = 0; semitone < 12; ++semitone) {
        Engine::Audio::ToneSpec tone;
        tone.wave = Engine::Audio::Waveform::Triangle;
        tone.frequencies = {Engine::Audio::noteFrequency(kMelodyRoot + semitone)};
        tone.noteSeconds = 20.0f / 120.0f;
        tone.volume = volume01;
        bank.emplace_back(melodySampleName(semitone), tone);
    }

    for (int instrument = 0; instrument < static_cast<int>(kInstrumentNames.size()); ++instrument) {
        for (int value = 0; value < kRhythmValues; ++value) {
            Engine::Audio::ToneSpec tone;
            tone.wave = waveFor(instrument);
            tone.frequencies = {Engine::Audio::noteFrequency(kRhythmRoot + instrument * 7 + value * 5)};
            tone.noteSeconds = 10.0f / 120.0f;
            tone.volume = volume01 * 0.7f;
            tone.fadeOut = true;
            bank.emplace_back(rhythmSampleName(instrument, value), tone);
        }
    }

    for (std::size_t i = 0; i < kAmbientNotes.size(); ++i) {
        auto freqs = Engine::Audio::parseNotes(kAmbientNotes[i]);
        if (!freqs) {
            Engine::logError(std::string("Bad ambient note string: ") + kAmbientNotes[i]);
            continue;
        }
        Engine::Audio::ToneSpec tone;
        tone.wave = Engine::Audio::Waveform::Square;
        tone.frequencies = std::move(*freqs);
        tone.noteSeconds = 40.0f / 120.0f;
        tone.volume = volume01 * 3.0f / 7.0f;
        tone.fadeOut = true;
        bank.emplace_back(ambientSampleName(static_cast<int>(i)), tone);
    }
    return bank;
}

}  // namespace Game

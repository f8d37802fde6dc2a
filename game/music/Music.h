// Adaptive background music driven by the simulation state each tick.
#pragma once

#include <set>
#include <vector>

#include "../../engine/audio/Synth.h"
#include "../enemies/EnemyKind.h"

namespace Game {

enum class MelodyPattern { Normal, Knife, HolyWater, MagicBlade, SacredFlame };
enum class RhythmPattern { Normal, Intense, Boss };

const char* melodyPatternName(MelodyPattern pattern);
const char* rhythmPatternName(RhythmPattern pattern);
const std::vector<int>& melodyNotes(MelodyPattern pattern);
const std::vector<int>& rhythmNotes(RhythmPattern pattern);

// Instrument id voiced for an enemy kind (zombie 0, bat 1, ghost 2, skeleton 3).
int instrumentFor(EnemyKind kind);

// What the music reacts to, sampled once per tick.
struct MusicInputs {
    float playerSpeed{0.0f};
    int enemyCount{0};
    std::set<EnemyKind> enemyKinds{};
    int elapsedMinutes{0};
};

class Music {
public:
    static constexpr int kMelodyChannel = 0;
    static constexpr int kRhythmChannel = 1;
    static constexpr int kAmbientChannel = 2;
    static constexpr int kAmbientInterval = 120;
    static constexpr int kAmbientVariants = 3;

    explicit Music(int baseBpm = 120) : baseBpm_(baseBpm), bpm_(baseBpm) {}

    // Re-derives tempo, patterns and instruments, then advances the timers and
    // emits whatever notes fall due on `synth`.
    void update(const MusicInputs& inputs, Engine::Audio::Synth& synth);

    int baseBpm() const { return baseBpm_; }
    int bpm() const { return bpm_; }
    // Ticks per beat at the current tempo.
    float beatTicks() const;
    MelodyPattern melody() const { return melody_; }
    RhythmPattern rhythm() const { return rhythm_; }
    const std::set<int>& activeInstruments() const { return instruments_; }
    int noteIndex() const { return noteIndex_; }

private:
    void play(Engine::Audio::Synth& synth);

    int baseBpm_;
    int bpm_;
    MelodyPattern melody_{MelodyPattern::Normal};
    RhythmPattern rhythm_{RhythmPattern::Normal};
    std::set<int> instruments_{};
    int melodyTimer_{0};
    int rhythmTimer_{0};
    int ambientTimer_{0};
    int noteIndex_{0};
};

}  // namespace Game

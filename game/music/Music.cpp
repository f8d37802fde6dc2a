#include "Music.h"

#include <cmath>

#include "MusicSamples.h"

namespace Game {

const char* melodyPatternName(MelodyPattern pattern) {
    switch (pattern) {
        case MelodyPattern::Normal: return "normal";
        case MelodyPattern::Knife: return "knife";
        case MelodyPattern::HolyWater: return "holy_water";
        case MelodyPattern::MagicBlade: return "magic_blade";
        case MelodyPattern::SacredFlame: return "sacred_flame";
    }
    return "normal";
}

const char* rhythmPatternName(RhythmPattern pattern) {
    switch (pattern) {
        case RhythmPattern::Normal: return "normal";
        case RhythmPattern::Intense: return "intense";
        case RhythmPattern::Boss: return "boss";
    }
    return "normal";
}

const std::vector<int>& melodyNotes(MelodyPattern pattern) {
    static const std::vector<int> normal{0, 4, 7, 4};
    static const std::vector<int> knife{0, 4, 7, 11};
    static const std::vector<int> holyWater{0, 3, 7, 10};
    static const std::vector<int> magicBlade{0, 4, 8, 11};
    static const std::vector<int> sacredFlame{0, 3, 6, 9};
    switch (pattern) {
        case MelodyPattern::Knife: return knife;
        case MelodyPattern::HolyWater: return holyWater;
        case MelodyPattern::MagicBlade: return magicBlade;
        case MelodyPattern::SacredFlame: return sacredFlame;
        case MelodyPattern::Normal: break;
    }
    return normal;
}

const std::vector<int>& rhythmNotes(RhythmPattern pattern) {
    static const std::vector<int> normal{0, 2};
    static const std::vector<int> intense{0, 1, 2, 3};
    static const std::vector<int> boss{0, 1, 1, 2, 2, 3};
    switch (pattern) {
        case RhythmPattern::Intense: return intense;
        case RhythmPattern::Boss: return boss;
        case RhythmPattern::Normal: break;
    }
    return normal;
}

int instrumentFor(EnemyKind kind) {
    switch (kind) {
        case EnemyKind::Zombie: return 0;
        case EnemyKind::Bat: return 1;
        case EnemyKind::Ghost: return 2;
        case EnemyKind::Skeleton: return 3;
    }
    return 0;
}

float Music::beatTicks() const { return 1800.0f / static_cast<float>(bpm_); }

void Music::update(const MusicInputs& inputs, Engine::Audio::Synth& synth) {
    // Up to +50% tempo at the speed cap.
    const float speedFactor = inputs.playerSpeed / 2.0f;
    bpm_ = static_cast<int>(std::lround(static_cast<float>(baseBpm_) * (1.0f + speedFactor * 0.5f)));
    if (bpm_ < 1) bpm_ = 1;

    if (inputs.enemyCount > 30) {
        rhythm_ = RhythmPattern::Boss;
    } else if (inputs.enemyCount > 15) {
        rhythm_ = RhythmPattern::Intense;
    } else {
        rhythm_ = RhythmPattern::Normal;
    }

    const auto& kinds = inputs.enemyKinds;
    if (kinds.count(EnemyKind::Ghost) > 0) {
        melody_ = MelodyPattern::HolyWater;
    } else if (kinds.count(EnemyKind::Skeleton) > 0) {
        melody_ = MelodyPattern::SacredFlame;
    } else if (kinds.count(EnemyKind::Bat) > 0) {
        melody_ = MelodyPattern::MagicBlade;
    } else if (kinds.count(EnemyKind::Zombie) > 0) {
        melody_ = MelodyPattern::Knife;
    } else {
        melody_ = MelodyPattern::Normal;
    }

    instruments_.clear();
    for (EnemyKind kind : kinds) {
        instruments_.insert(instrumentFor(kind));
    }

    ambientTimer_ += 1;
    if (ambientTimer_ >= kAmbientInterval) {
        ambientTimer_ = 0;
        if (inputs.elapsedMinutes > 0) {
            synth.trigger(kAmbientChannel, ambientSampleName(inputs.elapsedMinutes % kAmbientVariants));
        }
    }

    play(synth);
}

void Music::play(Engine::Audio::Synth& synth) {
    const float beat = beatTicks();

    melodyTimer_ += 1;
    if (static_cast<float>(melodyTimer_) >= beat) {
        melodyTimer_ = 0;
        const auto& notes = melodyNotes(melody_);
        noteIndex_ %= static_cast<int>(notes.size());
        synth.trigger(kMelodyChannel, melodySampleName(notes[noteIndex_]));
        noteIndex_ = (noteIndex_ + 1) % static_cast<int>(notes.size());
    }

    rhythmTimer_ += 1;
    if (static_cast<float>(rhythmTimer_) >= beat / 2.0f) {
        rhythmTimer_ = 0;
        const auto& notes = rhythmNotes(rhythm_);
        const int value = notes[static_cast<std::size_t>(noteIndex_) % notes.size()];
        for (int instrument : instruments_) {
            synth.trigger(kRhythmChannel, rhythmSampleName(instrument, value));
        }
    }
}

}  // namespace Game

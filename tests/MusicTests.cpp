// Adaptive music: tempo, pattern selection, note emission and the sample bank.
#include <cassert>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "../engine/audio/Synth.h"
#include "../game/Simulation.h"
#include "../game/music/Music.h"
#include "../game/music/MusicSamples.h"

using namespace Game;

namespace {
class RecordingSynth final : public Engine::Audio::Synth {
public:
    void trigger(int channel, const std::string& sample) override { events.emplace_back(channel, sample); }
    std::vector<std::pair<int, std::string>> events;
};

MusicInputs inputsWith(float speed, std::set<EnemyKind> kinds, int minutes = 0) {
    MusicInputs in;
    in.playerSpeed = speed;
    in.enemyCount = static_cast<int>(kinds.size());
    in.enemyKinds = std::move(kinds);
    in.elapsedMinutes = minutes;
    return in;
}
}  // namespace

int main() {
    Engine::Audio::NullSynth quiet;

    {
        Music m;
        m.update(inputsWith(2.0f, {}), quiet);
        assert(m.bpm() == 180);
        assert(m.beatTicks() == 10.0f);
        m.update(inputsWith(4.0f, {}), quiet);
        assert(m.bpm() == 240);
        m.update(inputsWith(0.0f, {}), quiet);
        assert(m.bpm() == 120);
        m.update(inputsWith(2.2f, {}), quiet);
        assert(m.bpm() == 186);
    }
    {
        // Rhythm thresholds driven by a real enemy population.
        GameConfig cfg{};
        cfg.seed = 7;
        const int counts[] = {31, 30, 16, 15, 10};
        const RhythmPattern expected[] = {RhythmPattern::Boss, RhythmPattern::Intense, RhythmPattern::Intense,
                                          RhythmPattern::Normal, RhythmPattern::Normal};
        for (int i = 0; i < 5; ++i) {
            Simulation sim(cfg);
            for (int n = 0; n < counts[i]; ++n) {
                sim.spawnEnemy(EnemyKind::Zombie, Engine::Vec2{-8.0f, -8.0f});
            }
            sim.music().update(sim.musicInputs(), quiet);
            assert(sim.music().rhythm() == expected[i]);
        }
        assert(std::string(rhythmPatternName(RhythmPattern::Boss)) == "boss");
    }
    {
        Music m;
        m.update(inputsWith(2.0f, {EnemyKind::Zombie}), quiet);
        assert(m.melody() == MelodyPattern::Knife);
        m.update(inputsWith(2.0f, {EnemyKind::Zombie, EnemyKind::Bat}), quiet);
        assert(m.melody() == MelodyPattern::MagicBlade);
        m.update(inputsWith(2.0f, {EnemyKind::Zombie, EnemyKind::Bat, EnemyKind::Skeleton}), quiet);
        assert(m.melody() == MelodyPattern::SacredFlame);
        m.update(inputsWith(2.0f, {EnemyKind::Skeleton, EnemyKind::Ghost}), quiet);
        assert(m.melody() == MelodyPattern::HolyWater);
        assert((m.activeInstruments() == std::set<int>{2, 3}));
        m.update(inputsWith(2.0f, {}), quiet);
        assert(m.melody() == MelodyPattern::Normal);
        assert(m.activeInstruments().empty());
    }
    {
        assert((melodyNotes(MelodyPattern::Normal) == std::vector<int>{0, 4, 7, 4}));
        assert((melodyNotes(MelodyPattern::SacredFlame) == std::vector<int>{0, 3, 6, 9}));
        assert((rhythmNotes(RhythmPattern::Boss) == std::vector<int>{0, 1, 1, 2, 2, 3}));
        assert(instrumentFor(EnemyKind::Bat) == 1);
    }
    {
        // 180 bpm: a melody note every 10 ticks, a rhythm hit every 5.
        Music m;
        RecordingSynth synth;
        const auto in = inputsWith(2.0f, {EnemyKind::Zombie});
        for (int i = 0; i < 4; ++i) m.update(in, synth);
        assert(synth.events.empty());
        m.update(in, synth);
        assert(synth.events.size() == 1);
        assert(synth.events[0] == std::make_pair(Music::kRhythmChannel, std::string("bass_0")));
        for (int i = 0; i < 5; ++i) m.update(in, synth);
        assert(synth.events.size() == 3);
        assert(synth.events[1] == std::make_pair(Music::kMelodyChannel, std::string("note_0")));
        assert(synth.events[2] == std::make_pair(Music::kRhythmChannel, std::string("bass_2")));
        for (int i = 0; i < 10; ++i) m.update(in, synth);
        assert(synth.events[4] == std::make_pair(Music::kMelodyChannel, std::string("note_4")));
        assert(m.noteIndex() == 2);
    }
    {
        Music m;
        RecordingSynth synth;
        for (int i = 0; i < 240; ++i) m.update(inputsWith(2.0f, {}), synth);
        for (const auto& e : synth.events) assert(e.first != Music::kAmbientChannel);

        Music later;
        RecordingSynth synth2;
        for (int i = 0; i < 120; ++i) later.update(inputsWith(2.0f, {}, 4), synth2);
        int ambient = 0;
        for (const auto& e : synth2.events) {
            if (e.first == Music::kAmbientChannel) {
                assert(e.second == "ambient_1");
                ++ambient;
            }
        }
        assert(ambient == 1);
    }
    {
        // Every name the music can emit has a recipe in the bank.
        std::set<std::string> bank;
        for (const auto& entry : musicSampleBank(0.5f)) {
            assert(!entry.second.frequencies.empty());
            bank.insert(entry.first);
        }
        RecordingSynth synth;
        const std::vector<std::set<EnemyKind>> mixes{
            {}, {EnemyKind::Zombie}, {EnemyKind::Bat}, {EnemyKind::Ghost}, {EnemyKind::Skeleton},
            {EnemyKind::Zombie, EnemyKind::Bat, EnemyKind::Ghost, EnemyKind::Skeleton}};
        const float speeds[] = {0.0f, 2.0f, 3.1f, 4.0f};
        const int counts[] = {0, 20, 40};
        for (const auto& mix : mixes) {
            for (float speed : speeds) {
                for (int count : counts) {
                    Music m;
                    MusicInputs in = inputsWith(speed, mix, 2);
                    in.enemyCount = count;
                    for (int i = 0; i < 400; ++i) m.update(in, synth);
                }
            }
        }
        assert(!synth.events.empty());
        for (const auto& e : synth.events) {
            assert(bank.count(e.second) == 1);
        }
    }
    return 0;
}

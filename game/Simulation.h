// Owns every entity of a run and advances the game one fixed tick at a time.
#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <vector>

#include "../engine/audio/Synth.h"
#include "../engine/input/ActionState.h"
#include "../engine/math/Vec2.h"
#include "GameConfig.h"
#include "LevelUp.h"
#include "enemies/Enemy.h"
#include "music/Music.h"
#include "player/Player.h"

namespace Game {

enum class SimMode { Running, ChoosingLevelUp };

class Simulation {
public:
    static constexpr int kTicksPerMinute = 60 * 60;
    static constexpr int kContactDamage = 1;

    explicit Simulation(const GameConfig& config = {});

    // Running: one full game tick. ChoosingLevelUp: only menu navigation and confirm.
    void update(const Engine::ActionState& input, Engine::Audio::Synth& synth);

    // Spawns at `position` with stats scaled to the elapsed time.
    Enemy& spawnEnemy(EnemyKind kind, Engine::Vec2 position);
    Enemy& spawnRandomEnemy();
    EnemyKind rollEnemyKind();

    std::vector<LevelUpOption> levelUpOptions() const;
    void applyLevelUpOption(LevelUpOption option);

    MusicInputs musicInputs() const;

    SimMode mode() const { return mode_; }
    const std::optional<LevelUpChoice>& pendingChoice() const { return choice_; }
    Player& player() { return player_; }
    const Player& player() const { return player_; }
    std::vector<Enemy>& enemies() { return enemies_; }
    const std::vector<Enemy>& enemies() const { return enemies_; }
    const Music& music() const { return music_; }
    Music& music() { return music_; }
    const GameConfig& config() const { return config_; }

    int score() const { return score_; }
    int highScore() const { return highScore_; }
    void setHighScore(int value) { highScore_ = value > score_ ? value : score_; }
    std::uint64_t elapsedFrames() const { return elapsedFrames_; }
    int elapsedMinutes() const { return elapsedMinutes_; }
    int spawnInterval() const { return spawnInterval_; }
    int spawnTimer() const { return spawnTimer_; }
    std::uint32_t seed() const { return seed_; }

private:
    void runTick(const Engine::ActionState& input, Engine::Audio::Synth& synth);
    void updateChoice(const Engine::ActionState& input);
    void resolveCollisions();
    void resolveDeaths();
    void enterLevelUp();

    GameConfig config_;
    std::uint32_t seed_{0};
    std::mt19937 rng_;
    Player player_;
    std::vector<Enemy> enemies_{};
    Music music_;
    SimMode mode_{SimMode::Running};
    std::optional<LevelUpChoice> choice_{};
    int score_{0};
    int highScore_{0};
    std::uint64_t elapsedFrames_{0};
    int elapsedMinutes_{0};
    int spawnTimer_{0};
    int spawnInterval_{30};
};

}  // namespace Game

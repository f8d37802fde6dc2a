#include "Simulation.h"

#include <algorithm>
#include <string>

#include "../engine/core/Logger.h"
#include "../engine/gameplay/Collision.h"

namespace Game {

namespace {
std::uint32_t resolveSeed(std::uint32_t configured) {
    if (configured != 0) return configured;
    std::random_device rd;
    return rd();
}

bool hasWeapon(const Player& player, WeaponKind kind) {
    const auto& weapons = player.weapons();
    return std::any_of(weapons.begin(), weapons.end(), [kind](const Weapon& w) { return w.kind() == kind; });
}

// Levels the first weapon of `kind`; returns false if none is held.
bool levelFirst(Player& player, WeaponKind kind) {
    for (auto& weapon : player.weapons()) {
        if (weapon.kind() == kind) {
            weapon.levelUp();
            return true;
        }
    }
    return false;
}

bool passiveOffered(const Player& player, PassiveKind kind) {
    const PassiveSkill* skill = player.passive(kind);
    return skill == nullptr || skill->level() < kMaxPassiveOfferLevel;
}
}  // namespace

Simulation::Simulation(const GameConfig& config)
    : config_(config),
      seed_(resolveSeed(config.seed)),
      rng_(seed_),
      player_(Engine::Vec2{static_cast<float>(config.screenWidth / 2), static_cast<float>(config.screenHeight / 2)},
              config.screenWidth, config.screenHeight),
      music_(config.baseBpm),
      spawnInterval_(config.spawn.intervalAt(0)) {}

void Simulation::update(const Engine::ActionState& input, Engine::Audio::Synth& synth) {
    switch (mode_) {
        case SimMode::ChoosingLevelUp:
            updateChoice(input);
            return;
        case SimMode::Running:
            runTick(input, synth);
            return;
    }
}

void Simulation::runTick(const Engine::ActionState& input, Engine::Audio::Synth& synth) {
    elapsedFrames_ += 1;
    if (elapsedFrames_ % kTicksPerMinute == 0) {
        elapsedMinutes_ += 1;
        spawnInterval_ = config_.spawn.intervalAt(elapsedMinutes_);
        Engine::logInfo("Minute " + std::to_string(elapsedMinutes_) + ": spawn interval now " +
                        std::to_string(spawnInterval_) + " ticks.");
    }

    player_.update(input);

    spawnTimer_ += 1;
    if (spawnTimer_ >= spawnInterval_) {
        spawnRandomEnemy();
        spawnTimer_ = 0;
    }

    const Engine::Vec2 target = player_.position();
    for (auto& enemy : enemies_) {
        enemy.update(target, rng_);
    }

    resolveCollisions();
    resolveDeaths();

    music_.update(musicInputs(), synth);
}

void Simulation::resolveCollisions() {
    using Engine::Gameplay::rectAt;
    using Engine::Gameplay::rectsOverlap;

    const auto playerBox = rectAt(player_.position(), Player::kSize, Player::kSize);
    for (const auto& enemy : enemies_) {
        if (rectsOverlap(playerBox, rectAt(enemy.position(), Enemy::kSize, Enemy::kSize))) {
            player_.takeDamage(static_cast<float>(kContactDamage));
        }
    }

    for (const auto& attack : player_.attacks()) {
        const int damage = attack.damageThisTick();
        if (damage <= 0) continue;
        const auto box = attack.hitbox();
        for (auto& enemy : enemies_) {
            if (rectsOverlap(box, rectAt(enemy.position(), Enemy::kSize, Enemy::kSize))) {
                enemy.takeDamage(damage);
            }
        }
    }
}

void Simulation::resolveDeaths() {
    bool leveled = false;
    auto it = enemies_.begin();
    while (it != enemies_.end()) {
        if (it->isAlive()) {
            ++it;
            continue;
        }
        const int exp = it->exp();
        it = enemies_.erase(it);
        score_ += exp;
        highScore_ = std::max(highScore_, score_);
        if (player_.gainExp(exp)) {
            Engine::logInfo("Level up! Now level " + std::to_string(player_.level()) + ".");
            leveled = true;
        }
    }
    if (leveled) {
        enterLevelUp();
    }
}

void Simulation::enterLevelUp() {
    LevelUpChoice choice;
    choice.options = levelUpOptions();
    choice.selected = 0;
    choice_ = std::move(choice);
    mode_ = SimMode::ChoosingLevelUp;
}

void Simulation::updateChoice(const Engine::ActionState& input) {
    if (!choice_ || choice_->options.empty()) {
        choice_.reset();
        mode_ = SimMode::Running;
        return;
    }
    if (input.menuUp) {
        choice_->moveSelection(-1);
    } else if (input.menuDown) {
        choice_->moveSelection(1);
    } else if (input.confirm) {
        const LevelUpOption picked = choice_->current();
        choice_.reset();
        mode_ = SimMode::Running;
        applyLevelUpOption(picked);
    }
}

std::vector<LevelUpOption> Simulation::levelUpOptions() const {
    std::vector<LevelUpOption> options;
    options.push_back(LevelUpOption::KnifeUpgrade);
    options.push_back(hasWeapon(player_, WeaponKind::HolyWater) ? LevelUpOption::HolyWaterUpgrade
                                                                : LevelUpOption::HolyWaterAdd);
    if (player_.hp() < Player::kMaxHp) {
        options.push_back(LevelUpOption::HpRestore);
    }
    if (player_.speed() < Player::kMaxSpeed) {
        options.push_back(LevelUpOption::SpeedUp);
    }
    if (passiveOffered(player_, PassiveKind::AttackSpeed)) {
        options.push_back(LevelUpOption::AttackSpeed);
    }
    if (passiveOffered(player_, PassiveKind::HpRegen)) {
        options.push_back(LevelUpOption::HpRegen);
    }
    if (options.size() > static_cast<std::size_t>(kMaxLevelUpOptions)) {
        options.resize(static_cast<std::size_t>(kMaxLevelUpOptions));
    }
    return options;
}

void Simulation::applyLevelUpOption(LevelUpOption option) {
    switch (option) {
        case LevelUpOption::KnifeUpgrade:
            levelFirst(player_, WeaponKind::Knife);
            break;
        case LevelUpOption::HolyWaterAdd:
            player_.addWeapon(WeaponKind::HolyWater);
            break;
        case LevelUpOption::HolyWaterUpgrade:
            levelFirst(player_, WeaponKind::HolyWater);
            break;
        case LevelUpOption::HpRestore:
            player_.heal(kHpRestoreAmount);
            break;
        case LevelUpOption::SpeedUp:
            player_.addPassiveSkill(PassiveKind::SpeedUp);
            break;
        case LevelUpOption::AttackSpeed:
            player_.addPassiveSkill(PassiveKind::AttackSpeed);
            break;
        case LevelUpOption::HpRegen:
            player_.addPassiveSkill(PassiveKind::HpRegen);
            break;
    }
    Engine::logInfo(std::string("Level-up option applied: ") + levelUpOptionLabel(option));
}

Enemy& Simulation::spawnEnemy(EnemyKind kind, Engine::Vec2 position) {
    enemies_.emplace_back(kind, scaledEnemyStats(kind, elapsedMinutes_, config_.difficulty), position, rng_);
    return enemies_.back();
}

EnemyKind Simulation::rollEnemyKind() {
    const auto& weights = config_.spawn.weights;
    float total = 0.0f;
    for (const auto& entry : weights) total += entry.second;
    std::uniform_real_distribution<float> dist(0.0f, total);
    float r = dist(rng_);
    for (const auto& entry : weights) {
        if (r < entry.second) return entry.first;
        r -= entry.second;
    }
    return weights.back().first;
}

Enemy& Simulation::spawnRandomEnemy() {
    const int w = config_.screenWidth;
    const int h = config_.screenHeight;
    const int size = static_cast<int>(Enemy::kSize);
    std::uniform_int_distribution<int> sideDist(0, 3);
    std::uniform_int_distribution<int> xDist(0, w - size);
    std::uniform_int_distribution<int> yDist(0, h - size);

    // Just outside the visible area: 0 top, 1 right, 2 bottom, 3 left.
    Engine::Vec2 pos{};
    switch (sideDist(rng_)) {
        case 0:
            pos = Engine::Vec2{static_cast<float>(xDist(rng_)), static_cast<float>(-size)};
            break;
        case 1:
            pos = Engine::Vec2{static_cast<float>(w), static_cast<float>(yDist(rng_))};
            break;
        case 2:
            pos = Engine::Vec2{static_cast<float>(xDist(rng_)), static_cast<float>(h)};
            break;
        default:
            pos = Engine::Vec2{static_cast<float>(-size), static_cast<float>(yDist(rng_))};
            break;
    }
    return spawnEnemy(rollEnemyKind(), pos);
}

MusicInputs Simulation::musicInputs() const {
    MusicInputs in;
    in.playerSpeed = player_.speed();
    in.enemyCount = static_cast<int>(enemies_.size());
    for (const auto& enemy : enemies_) {
        in.enemyKinds.insert(enemy.kind());
    }
    in.elapsedMinutes = elapsedMinutes_;
    return in;
}

}  // namespace Game

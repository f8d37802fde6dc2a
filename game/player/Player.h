// The player character: movement, health, leveling and the weapon roster.
#pragma once

#include <map>
#include <vector>

#include "../../engine/input/ActionState.h"
#include "../../engine/math/Vec2.h"
#include "../weapons/Attack.h"
#include "../weapons/Weapon.h"
#include "PassiveSkill.h"

namespace Game {

class Player {
public:
    static constexpr float kSize = 8.0f;
    static constexpr float kMaxHp = 200.0f;
    static constexpr float kStartHp = 100.0f;
    static constexpr float kStartSpeed = 2.0f;
    static constexpr float kMaxSpeed = 4.0f;
    static constexpr int kStartExpToNext = 10;

    Player(Engine::Vec2 position, int boundsWidth, int boundsHeight);

    // Movement, regeneration, weapon firing and attack upkeep for one tick.
    void update(const Engine::ActionState& input);

    // Returns true if the gain caused a level-up (at most one per call).
    bool gainExp(int amount);
    void levelUp();

    void addWeapon(WeaponKind kind);
    void addPassiveSkill(PassiveKind kind);

    void takeDamage(float amount);
    void heal(float amount);

    // Base speed plus SpeedUp, capped.
    float speed() const;
    float baseSpeed() const { return baseSpeed_; }
    double passiveBonus(PassiveKind kind) const;
    const PassiveSkill* passive(PassiveKind kind) const;

    const Engine::Vec2& position() const { return position_; }
    void setPosition(const Engine::Vec2& pos) { position_ = pos; }
    const Engine::Vec2& facing() const { return facing_; }
    float hp() const { return hp_; }
    int level() const { return level_; }
    int exp() const { return exp_; }
    int expToNextLevel() const { return expToNext_; }

    std::vector<Weapon>& weapons() { return weapons_; }
    const std::vector<Weapon>& weapons() const { return weapons_; }
    const std::vector<Attack>& attacks() const { return attacks_; }
    const std::map<PassiveKind, PassiveSkill>& passives() const { return passives_; }

private:
    int boundsWidth_;
    int boundsHeight_;
    Engine::Vec2 position_{};
    Engine::Vec2 facing_{1.0f, 0.0f};
    float hp_{kStartHp};
    float baseSpeed_{kStartSpeed};
    int exp_{0};
    int level_{1};
    int expToNext_{kStartExpToNext};
    std::vector<Weapon> weapons_{};
    std::vector<Attack> attacks_{};
    std::map<PassiveKind, PassiveSkill> passives_{};
};

}  // namespace Game

#include "Player.h"

#include <algorithm>
#include <cmath>

namespace Game {

Player::Player(Engine::Vec2 position, int boundsWidth, int boundsHeight)
    : boundsWidth_(boundsWidth), boundsHeight_(boundsHeight), position_(position) {
    weapons_.emplace_back(WeaponKind::Knife);
}

double Player::passiveBonus(PassiveKind kind) const {
    auto it = passives_.find(kind);
    return it == passives_.end() ? 0.0 : it->second.bonus();
}

const PassiveSkill* Player::passive(PassiveKind kind) const {
    auto it = passives_.find(kind);
    return it == passives_.end() ? nullptr : &it->second;
}

float Player::speed() const {
    const double total = static_cast<double>(baseSpeed_) + passiveBonus(PassiveKind::SpeedUp);
    return static_cast<float>(std::min(total, static_cast<double>(kMaxSpeed)));
}

void Player::update(const Engine::ActionState& input) {
    // Facing follows the movement axes and holds its last value when they are idle.
    if (input.moveX != 0.0f || input.moveY != 0.0f) {
        const float len = std::sqrt(input.moveX * input.moveX + input.moveY * input.moveY);
        facing_ = Engine::Vec2{input.moveX / len, input.moveY / len};
    }

    // Each held direction moves on its own axis; diagonals are not normalized.
    const float s = speed();
    const float maxX = static_cast<float>(boundsWidth_) - kSize;
    const float maxY = static_cast<float>(boundsHeight_) - kSize;
    if (input.left) position_.x = std::max(0.0f, position_.x - s);
    if (input.right) position_.x = std::min(maxX, position_.x + s);
    if (input.up) position_.y = std::max(0.0f, position_.y - s);
    if (input.down) position_.y = std::min(maxY, position_.y + s);

    if (passives_.count(PassiveKind::HpRegen) > 0) {
        heal(static_cast<float>(passiveBonus(PassiveKind::HpRegen)));
    }

    const double attackSpeed = passiveBonus(PassiveKind::AttackSpeed);
    for (auto& weapon : weapons_) {
        weapon.update();
        if (weapon.canAttack()) {
            attacks_.emplace_back(position_, weapon, facing_);
            weapon.startCooldown(attackSpeed);
        }
    }

    attacks_.erase(std::remove_if(attacks_.begin(), attacks_.end(), [](const Attack& a) { return !a.isAlive(); }),
                   attacks_.end());
    for (auto& attack : attacks_) {
        attack.update();
    }
}

bool Player::gainExp(int amount) {
    exp_ += amount;
    if (exp_ >= expToNext_) {
        levelUp();
        return true;
    }
    return false;
}

void Player::levelUp() {
    level_ += 1;
    exp_ -= expToNext_;
    expToNext_ = static_cast<int>(std::floor(static_cast<float>(expToNext_) * 1.5f));
    hp_ = std::min(kMaxHp, hp_ + 10.0f);
    baseSpeed_ = std::min(kMaxSpeed, baseSpeed_ + 0.2f);
}

void Player::addWeapon(WeaponKind kind) { weapons_.emplace_back(kind); }

void Player::addPassiveSkill(PassiveKind kind) {
    auto it = passives_.find(kind);
    if (it == passives_.end()) {
        passives_.emplace(kind, PassiveSkill(kind));
    } else {
        it->second.levelUp();
    }
}

void Player::takeDamage(float amount) { hp_ = std::max(0.0f, hp_ - amount); }

void Player::heal(float amount) { hp_ = std::min(kMaxHp, hp_ + amount); }

}  // namespace Game

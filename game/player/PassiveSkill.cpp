#include "PassiveSkill.h"

#include <stdexcept>
#include <string>

namespace Game {

const char* passiveKindName(PassiveKind kind) {
    switch (kind) {
        case PassiveKind::SpeedUp: return "speed_up";
        case PassiveKind::AttackSpeed: return "attack_speed";
        case PassiveKind::HpRegen: return "hp_regen";
    }
    return "unknown";
}

PassiveSkill::PassiveSkill(PassiveKind kind) : kind_(kind) {
    switch (kind_) {
        case PassiveKind::SpeedUp: perLevel_ = 0.2; return;
        case PassiveKind::AttackSpeed: perLevel_ = 0.1; return;
        case PassiveKind::HpRegen: perLevel_ = 0.1; return;
    }
    throw std::invalid_argument("Unknown passive skill " + std::to_string(static_cast<int>(kind_)));
}

}  // namespace Game

#include "LevelUp.h"

namespace Game {

const char* levelUpOptionLabel(LevelUpOption option) {
    switch (option) {
        case LevelUpOption::KnifeUpgrade: return "KNIFE UP";
        case LevelUpOption::HolyWaterAdd: return "ADD HOLY WATER";
        case LevelUpOption::HolyWaterUpgrade: return "HOLY WATER UP";
        case LevelUpOption::HpRestore: return "RESTORE HP";
        case LevelUpOption::SpeedUp: return "SPEED UP";
        case LevelUpOption::AttackSpeed: return "ATTACK SPEED UP";
        case LevelUpOption::HpRegen: return "HP REGEN";
    }
    return "?";
}

void LevelUpChoice::moveSelection(int delta) {
    const int n = static_cast<int>(options.size());
    if (n == 0) return;
    selected = ((selected + delta) % n + n) % n;
}

}  // namespace Game

// Level-up choices offered by the modal selection screen.
#pragma once

#include <vector>

namespace Game {

enum class LevelUpOption { KnifeUpgrade, HolyWaterAdd, HolyWaterUpgrade, HpRestore, SpeedUp, AttackSpeed, HpRegen };

constexpr int kMaxLevelUpOptions = 3;
constexpr int kMaxPassiveOfferLevel = 5;
constexpr float kHpRestoreAmount = 50.0f;

const char* levelUpOptionLabel(LevelUpOption option);

struct LevelUpChoice {
    std::vector<LevelUpOption> options{};
    int selected{0};

    // Wraps around both ends.
    void moveSelection(int delta);
    LevelUpOption current() const { return options[static_cast<std::size_t>(selected)]; }
};

}  // namespace Game

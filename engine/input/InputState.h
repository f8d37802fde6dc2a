// Per-frame input snapshot of the six logical buttons.
#pragma once

#include <array>

namespace Engine {

enum class InputKey {
    Up = 0,
    Down,
    Left,
    Right,
    Confirm,
    Cancel,
    Count
};

class InputState {
public:
    // A transition from up to down also marks the key as pressed for the current frame.
    void setKeyDown(InputKey key, bool down) {
        const auto idx = static_cast<int>(key);
        if (down && !keys_[idx]) pressed_[idx] = true;
        keys_[idx] = down;
    }
    bool isDown(InputKey key) const { return keys_[static_cast<int>(key)]; }
    bool wasPressed(InputKey key) const { return pressed_[static_cast<int>(key)]; }

    void nextFrame() { pressed_.fill(false); }

private:
    std::array<bool, static_cast<int>(InputKey::Count)> keys_{};
    std::array<bool, static_cast<int>(InputKey::Count)> pressed_{};
};

}  // namespace Engine

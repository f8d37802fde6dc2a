#include "ActionMapper.h"

namespace Engine {

float ActionMapper::axisFromKeys(InputKey positive, InputKey negative, const InputState& input) {
    float value = 0.0f;
    if (input.isDown(positive)) value += 1.0f;
    if (input.isDown(negative)) value -= 1.0f;
    return value;
}

ActionState ActionMapper::sample(const InputState& input) const {
    ActionState act{};
    act.moveX = axisFromKeys(InputKey::Right, InputKey::Left, input);
    act.moveY = axisFromKeys(InputKey::Down, InputKey::Up, input);

    act.left = input.isDown(InputKey::Left);
    act.right = input.isDown(InputKey::Right);
    act.up = input.isDown(InputKey::Up);
    act.down = input.isDown(InputKey::Down);

    act.menuUp = input.wasPressed(InputKey::Up);
    act.menuDown = input.wasPressed(InputKey::Down);
    act.confirm = input.wasPressed(InputKey::Confirm);
    act.cancel = input.wasPressed(InputKey::Cancel);
    return act;
}

}  // namespace Engine

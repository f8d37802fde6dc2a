// Maps InputState to higher-level ActionState.
#pragma once

#include "ActionState.h"
#include "InputState.h"

namespace Engine {

class ActionMapper {
public:
    ActionState sample(const InputState& input) const;

private:
    static float axisFromKeys(InputKey positive, InputKey negative, const InputState& input);
};

}  // namespace Engine

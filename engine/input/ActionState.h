// High-level input actions derived from raw InputState.
#pragma once

namespace Engine {

struct ActionState {
    // Movement axes in {-1, 0, 1}; opposing keys cancel. Drives facing.
    float moveX{0.0f};
    float moveY{0.0f};

    // Held directions; movement applies each pressed axis independently.
    bool left{false};
    bool right{false};
    bool up{false};
    bool down{false};

    // Edges for the modal choice screen and quitting.
    bool menuUp{false};
    bool menuDown{false};
    bool confirm{false};
    bool cancel{false};
};

}  // namespace Engine

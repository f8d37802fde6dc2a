// Data-driven input binding definitions: key names per logical button.
#pragma once

#include <string>
#include <vector>

namespace Engine {

struct InputBindings {
    std::vector<std::string> up{"Up", "W"};
    std::vector<std::string> down{"Down", "S"};
    std::vector<std::string> left{"Left", "A"};
    std::vector<std::string> right{"Right", "D"};
    std::vector<std::string> confirm{"Space", "Return", "Z"};
    std::vector<std::string> cancel{"Escape"};
};

}  // namespace Engine

#include "InputLoader.h"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "../core/Logger.h"

namespace Engine {

namespace {
std::vector<std::string> readStrings(const nlohmann::json& arr) {
    std::vector<std::string> out;
    if (!arr.is_array()) return out;
    for (const auto& v : arr) {
        if (v.is_string()) out.push_back(v.get<std::string>());
    }
    return out;
}

// Missing or empty lists keep the default keys for that button.
void readButton(const nlohmann::json& j, const char* key, std::vector<std::string>& dst) {
    if (!j.contains(key)) return;
    auto keys = readStrings(j[key]);
    if (!keys.empty()) dst = std::move(keys);
}
}  // namespace

std::optional<InputBindings> InputLoader::loadFromString(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        logWarn(std::string("Input bindings parse error: ") + e.what());
        return std::nullopt;
    }
    if (!j.is_object()) {
        logWarn("Input bindings must be a JSON object.");
        return std::nullopt;
    }

    InputBindings bindings;
    readButton(j, "up", bindings.up);
    readButton(j, "down", bindings.down);
    readButton(j, "left", bindings.left);
    readButton(j, "right", bindings.right);
    readButton(j, "confirm", bindings.confirm);
    readButton(j, "cancel", bindings.cancel);
    return bindings;
}

std::optional<InputBindings> InputLoader::loadFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return loadFromString(buffer.str());
}

}  // namespace Engine

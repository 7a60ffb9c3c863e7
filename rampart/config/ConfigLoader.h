// Loads a GameConfig from JSON, overlaying the file on the built-in defaults.
#pragma once

#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "GameConfig.h"

namespace Rampart {

class ConfigLoader {
public:
    // nullopt when the file cannot be read or parsed; the reason is logged.
    static std::optional<GameConfig> loadFromFile(const std::string& path);
    static std::optional<GameConfig> loadFromString(const std::string& text);
    // Keys missing from the document keep the values already in `base`.
    static std::optional<GameConfig> fromJson(const nlohmann::json& doc, GameConfig base);
};

}  // namespace Rampart

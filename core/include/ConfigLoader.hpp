#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace Jukebox {

// Reads the JSON music configuration. Throws ConfigError.
class ConfigLoader {
public:
    static nlohmann::json loadFile(const std::string& path);
    static nlohmann::json parse(const std::string& text);
};

} // namespace Jukebox

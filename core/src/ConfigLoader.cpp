#include "ConfigLoader.hpp"
#include "Errors.hpp"
#include "Log.hpp"

#include <fstream>

using json = nlohmann::json;

namespace Jukebox {

json ConfigLoader::loadFile(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw ConfigError("Cannot open config file " + path);
    }

    json j;
    try {
        f >> j;
    } catch (const json::parse_error& e) {
        throw ConfigError("Failed to parse " + path + ": " + e.what());
    }

    Log::debug("[ConfigLoader] Loaded " + path);
    return j;
}

json ConfigLoader::parse(const std::string& text) {
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("Failed to parse config: ") + e.what());
    }
}

} // namespace Jukebox

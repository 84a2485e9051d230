#pragma once
#include <optional>
#include <string>
#include "Errors.hpp"
#include <nlohmann/json.hpp>

// Field accessors shared by the configuration constructors.
// Every failure is reported as a ConfigError naming the entity and the key.

namespace Jukebox {
namespace ConfigFields {

using json = nlohmann::json;

inline void requireObject(const json& config, const std::string& entity) {
    if (!config.is_object()) {
        throw ConfigError(entity + " config must be an object");
    }
}

inline const json& require(const json& config, const std::string& key, const std::string& entity) {
    auto it = config.find(key);
    if (it == config.end()) {
        throw ConfigError(entity + " config is missing required field '" + key + "'");
    }
    return *it;
}

inline std::string requireString(const json& config, const std::string& key, const std::string& entity) {
    const json& value = require(config, key, entity);
    if (!value.is_string()) {
        throw ConfigError(entity + " field '" + key + "' must be a string");
    }
    return value.get<std::string>();
}

inline const json& requireArray(const json& config, const std::string& key, const std::string& entity) {
    const json& value = require(config, key, entity);
    if (!value.is_array()) {
        throw ConfigError(entity + " field '" + key + "' must be a list");
    }
    return value;
}

inline std::optional<std::string> optionalString(const json& config, const std::string& key,
                                                 const std::string& entity) {
    auto it = config.find(key);
    if (it == config.end() || it->is_null()) return std::nullopt;
    if (!it->is_string()) {
        throw ConfigError(entity + " field '" + key + "' must be a string");
    }
    return it->get<std::string>();
}

inline bool optionalBool(const json& config, const std::string& key, bool fallback,
                         const std::string& entity) {
    auto it = config.find(key);
    if (it == config.end() || it->is_null()) return fallback;
    if (!it->is_boolean()) {
        throw ConfigError(entity + " field '" + key + "' must be true or false");
    }
    return it->get<bool>();
}

} // namespace ConfigFields
} // namespace Jukebox

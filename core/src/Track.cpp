#include "Track.hpp"
#include "ConfigFields.hpp"
#include "Errors.hpp"

namespace Jukebox {

namespace {

// Keeps hours * 3600 * 1000 inside int64_t
constexpr int64_t kMaxTimeField = 1000000000000LL;

std::optional<int64_t> optionalTime(const nlohmann::json& config, const std::string& key) {
    std::optional<std::string> text = ConfigFields::optionalString(config, key, "Track");
    if (!text) return std::nullopt;
    return Track::parseTime(*text);
}

} // namespace

Track::Track(const std::string& file)
    : m_file(file) {
    if (m_file.empty()) {
        throw ConfigError("Track file name must not be empty");
    }
}

Track::Track(const std::string& file, std::optional<int64_t> startAt, std::optional<int64_t> endAt)
    : m_file(file), m_startAt(startAt), m_endAt(endAt) {
    if (m_file.empty()) {
        throw ConfigError("Track file name must not be empty");
    }
    if ((m_startAt && *m_startAt < 0) || (m_endAt && *m_endAt < 0)) {
        throw ConfigError("Track '" + m_file + "' has a negative trim point");
    }
}

Track::Track(const nlohmann::json& config) {
    if (config.is_string()) {
        m_file = config.get<std::string>();
    } else {
        ConfigFields::requireObject(config, "Track");
        m_file = ConfigFields::requireString(config, "file", "Track");
        m_startAt = optionalTime(config, "start_at");
        m_endAt = optionalTime(config, "end_at");
    }
    if (m_file.empty()) {
        throw ConfigError("Track file name must not be empty");
    }
}

bool Track::operator==(const Track& other) const {
    return m_file == other.m_file && m_startAt == other.m_startAt && m_endAt == other.m_endAt;
}

int64_t Track::parseTime(const std::string& formatted) {
    // Exactly three non-empty unsigned fields. Values are not range checked:
    // a trim point past the end of the file is left to the engine.
    int64_t fields[3] = {0, 0, 0};
    size_t field = 0;
    bool sawDigit = false;

    for (char c : formatted) {
        if (c == ':') {
            if (!sawDigit || field == 2) {
                throw FormatError("Invalid time '" + formatted + "', expected H:M:S");
            }
            ++field;
            sawDigit = false;
        } else if (c >= '0' && c <= '9') {
            fields[field] = fields[field] * 10 + (c - '0');
            if (fields[field] > kMaxTimeField) {
                throw FormatError("Time '" + formatted + "' is out of range");
            }
            sawDigit = true;
        } else {
            throw FormatError("Invalid time '" + formatted + "', expected H:M:S");
        }
    }

    if (field != 2 || !sawDigit) {
        throw FormatError("Invalid time '" + formatted + "', expected H:M:S");
    }

    const int64_t seconds = fields[0] * 3600 + fields[1] * 60 + fields[2];
    return seconds * 1000;
}

} // namespace Jukebox

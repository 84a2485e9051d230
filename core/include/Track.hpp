#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace Jukebox {

/**
 * A single playable item: a file name relative to the track list's
 * directory, with optional trim points in milliseconds.
 *
 * Config is either a bare file name or an object:
 *   { "file": "intro.mp3", "start_at": "00:00:05", "end_at": "00:01:30" }
 */
class Track {
public:
    explicit Track(const std::string& file);
    explicit Track(const char* file) : Track(std::string(file)) {}
    Track(const std::string& file, std::optional<int64_t> startAt, std::optional<int64_t> endAt);
    explicit Track(const nlohmann::json& config);

    const std::string& file() const { return m_file; }
    std::optional<int64_t> startAt() const { return m_startAt; }
    std::optional<int64_t> endAt() const { return m_endAt; }

    bool operator==(const Track& other) const;
    bool operator!=(const Track& other) const { return !(*this == other); }

    // "H:M:S" -> milliseconds. Throws FormatError.
    static int64_t parseTime(const std::string& formatted);

private:
    std::string m_file;
    std::optional<int64_t> m_startAt;
    std::optional<int64_t> m_endAt;
};

} // namespace Jukebox

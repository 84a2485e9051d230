#pragma once
#include <optional>
#include <string>
#include <vector>
#include "Track.hpp"
#include <nlohmann/json.hpp>

namespace Jukebox {

/**
 * Ordered, immutable list of tracks plus its playback policy.
 *
 * Config keys: "name" (required), "directory", "loop" (default true),
 * "shuffle" (default true), "tracks" (required, list of Track configs).
 */
class TrackList {
public:
    explicit TrackList(const nlohmann::json& config);

    const std::string& name() const { return m_name; }
    const std::optional<std::string>& directory() const { return m_directory; }
    bool loop() const { return m_loop; }
    bool shuffle() const { return m_shuffle; }
    const std::vector<Track>& tracks() const { return m_tracks; }

    bool operator==(const TrackList& other) const;
    bool operator!=(const TrackList& other) const { return !(*this == other); }

private:
    std::string m_name;
    std::optional<std::string> m_directory;
    bool m_loop = true;
    bool m_shuffle = true;
    std::vector<Track> m_tracks;
};

} // namespace Jukebox

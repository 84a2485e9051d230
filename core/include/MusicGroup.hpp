#pragma once
#include <optional>
#include <string>
#include <vector>
#include "TrackList.hpp"
#include <nlohmann/json.hpp>

namespace Jukebox {

/**
 * Named collection of track lists sharing an optional directory.
 * Track lists are sorted by name unless "sort" is false.
 */
class MusicGroup {
public:
    explicit MusicGroup(const nlohmann::json& config);

    const std::string& name() const { return m_name; }
    const std::optional<std::string>& directory() const { return m_directory; }
    const std::vector<TrackList>& trackLists() const { return m_trackLists; }

    bool operator==(const MusicGroup& other) const;
    bool operator!=(const MusicGroup& other) const { return !(*this == other); }

private:
    std::string m_name;
    std::optional<std::string> m_directory;
    std::vector<TrackList> m_trackLists;
};

} // namespace Jukebox

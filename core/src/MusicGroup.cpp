#include "MusicGroup.hpp"
#include "ConfigFields.hpp"

#include <algorithm>

namespace Jukebox {

MusicGroup::MusicGroup(const nlohmann::json& config) {
    ConfigFields::requireObject(config, "MusicGroup");
    m_name = ConfigFields::requireString(config, "name", "MusicGroup");

    const std::string entity = "MusicGroup '" + m_name + "'";
    m_directory = ConfigFields::optionalString(config, "directory", entity);

    const auto& trackLists = ConfigFields::requireArray(config, "track_lists", entity);
    m_trackLists.reserve(trackLists.size());
    for (const auto& trackListConfig : trackLists) {
        m_trackLists.emplace_back(trackListConfig);
    }

    if (ConfigFields::optionalBool(config, "sort", true, entity)) {
        std::stable_sort(m_trackLists.begin(), m_trackLists.end(),
                         [](const TrackList& a, const TrackList& b) { return a.name() < b.name(); });
    }
}

bool MusicGroup::operator==(const MusicGroup& other) const {
    return m_name == other.m_name
        && m_directory == other.m_directory
        && m_trackLists == other.m_trackLists;
}

} // namespace Jukebox

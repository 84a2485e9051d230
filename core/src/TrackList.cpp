#include "TrackList.hpp"
#include "ConfigFields.hpp"

namespace Jukebox {

TrackList::TrackList(const nlohmann::json& config) {
    ConfigFields::requireObject(config, "TrackList");
    m_name = ConfigFields::requireString(config, "name", "TrackList");

    const std::string entity = "TrackList '" + m_name + "'";
    m_directory = ConfigFields::optionalString(config, "directory", entity);
    m_loop = ConfigFields::optionalBool(config, "loop", true, entity);
    m_shuffle = ConfigFields::optionalBool(config, "shuffle", true, entity);

    const auto& tracks = ConfigFields::requireArray(config, "tracks", entity);
    m_tracks.reserve(tracks.size());
    for (const auto& trackConfig : tracks) {
        m_tracks.emplace_back(trackConfig);
    }
}

bool TrackList::operator==(const TrackList& other) const {
    return m_name == other.m_name
        && m_directory == other.m_directory
        && m_loop == other.m_loop
        && m_shuffle == other.m_shuffle
        && m_tracks == other.m_tracks;
}

} // namespace Jukebox

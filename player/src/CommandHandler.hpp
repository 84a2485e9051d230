#pragma once
#include <string>
#include "MusicManager.hpp"

namespace Jukebox {

/**
 * Text commands accepted on the control socket:
 *   play <group> <list>        start a track list (indices from "list")
 *   stop                       cancel playback
 *   volume <0-100> [instant]   change the global volume, fading by default
 *                              (the fade blocks this handler for its duration)
 *   status                     current track list and volume
 *   list                       configured groups and track lists
 * Replies start with "OK" or "ERROR:" and end with a newline.
 */
class CommandHandler {
public:
    static constexpr double kDefaultFadeSeconds = 0.5;

    explicit CommandHandler(MusicManager& manager, double fadeSeconds = kDefaultFadeSeconds);

    std::string handle(const std::string& commandLine);

private:
    std::string play(const std::string& args);
    std::string volume(const std::string& args);
    std::string status() const;
    std::string list() const;

    MusicManager& m_manager;
    double m_fadeSeconds;
};

} // namespace Jukebox

#include "CommandHandler.hpp"
#include "Errors.hpp"
#include "Log.hpp"

#include <algorithm>
#include <sstream>

namespace Jukebox {

namespace {

std::string trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

// Whole-token unsigned parse; rejects "1x" and "-1"
bool parseIndex(const std::string& token, size_t& out) {
    if (token.empty() || token.size() > 9) return false;
    size_t value = 0;
    for (char c : token) {
        if (c < '0' || c > '9') return false;
        value = value * 10 + static_cast<size_t>(c - '0');
    }
    out = value;
    return true;
}

} // namespace

CommandHandler::CommandHandler(MusicManager& manager, double fadeSeconds)
    : m_manager(manager)
    , m_fadeSeconds(fadeSeconds > 0.0 ? fadeSeconds : 0.0) {
}

std::string CommandHandler::handle(const std::string& commandLine) {
    const std::string line = trim(commandLine);
    Log::debug("[CommandHandler] Received: " + line);
    if (line.empty()) return "ERROR: Empty command\n";

    std::string cmd, args;
    size_t spacePos = line.find(' ');
    if (spacePos != std::string::npos) {
        cmd = line.substr(0, spacePos);
        args = trim(line.substr(spacePos + 1));
    } else {
        cmd = line;
    }

    if (cmd == "play") {
        return play(args);
    } else if (cmd == "stop") {
        m_manager.cancel();
        return "OK\n";
    } else if (cmd == "volume") {
        return volume(args);
    } else if (cmd == "status") {
        return status();
    } else if (cmd == "list") {
        return list();
    }
    return "ERROR: Unknown command '" + cmd + "'\n";
}

std::string CommandHandler::play(const std::string& args) {
    std::istringstream in(args);
    std::string groupToken, listToken, extra;
    in >> groupToken >> listToken >> extra;

    size_t groupIndex = 0;
    size_t listIndex = 0;
    if (!extra.empty() || !parseIndex(groupToken, groupIndex) || !parseIndex(listToken, listIndex)) {
        return "ERROR: Usage: play <group> <list>\n";
    }

    try {
        m_manager.requestPlay(groupIndex, listIndex);
    } catch (const IndexError& e) {
        return std::string("ERROR: ") + e.what() + "\n";
    }

    const TrackList& trackList = m_manager.groups()[groupIndex].trackLists()[listIndex];
    return "OK: Playing " + trackList.name() + "\n";
}

std::string CommandHandler::volume(const std::string& args) {
    std::istringstream in(args);
    std::string valueToken, mode, extra;
    in >> valueToken >> mode >> extra;

    size_t value = 0;
    if (!extra.empty() || !parseIndex(valueToken, value) || value > 100 || (!mode.empty() && mode != "instant")) {
        return "ERROR: Usage: volume <0-100> [instant]\n";
    }

    // One step per 50 ms keeps the ramp smooth without stalling the socket
    const int steps = std::max(1, static_cast<int>(m_fadeSeconds * 20.0));
    m_manager.setVolume(static_cast<int>(value), true, mode.empty() && m_fadeSeconds > 0.0, steps, m_fadeSeconds);
    return "OK: Volume " + std::to_string(value) + "\n";
}

std::string CommandHandler::status() const {
    std::ostringstream ss;
    auto playing = m_manager.currentlyPlaying();
    if (playing) {
        ss << "OK: PLAYING " << playing->group->name() << " / " << playing->trackList->name();
    } else {
        ss << "OK: IDLE";
        auto outcome = m_manager.lastOutcome();
        if (outcome) {
            ss << " (last session " << toString(*outcome) << ")";
        }
    }
    ss << " volume=" << m_manager.volume() << "\n";
    return ss.str();
}

std::string CommandHandler::list() const {
    std::ostringstream ss;
    ss << "OK\n";
    const auto& groups = m_manager.groups();
    for (size_t g = 0; g < groups.size(); g++) {
        ss << g << " " << groups[g].name() << "\n";
        const auto& trackLists = groups[g].trackLists();
        for (size_t t = 0; t < trackLists.size(); t++) {
            ss << "  " << g << " " << t << " " << trackLists[t].name()
               << " (" << trackLists[t].tracks().size() << " tracks)\n";
        }
    }
    return ss.str();
}

} // namespace Jukebox

#pragma once
#include <functional>
#include <string>

namespace Jukebox {

/**
 * Process wide leveled logger.
 * Lines go to stdout (debug/info) or stderr (warn/error) unless a sink
 * is installed. Messages carry their own component prefix, e.g.
 * "[MusicManager] Created a task to play 'Ambient'".
 */
class Log {
public:
    enum class Level {
        Debug = 0,
        Info = 1,
        Warn = 2,
        Error = 3
    };

    using Sink = std::function<void(Level, const std::string&)>;

    static void setLevel(Level level);
    static bool setLevelFromString(const std::string& levelText);
    static Level level();

    // Replaces console output. An empty sink restores it.
    static void setSink(Sink sink);

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    static const char* label(Level level);

private:
    static void write(Level level, const std::string& message);
    static std::string timestamp();
};

} // namespace Jukebox

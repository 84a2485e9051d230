#include "Log.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace Jukebox {

namespace {

std::mutex g_logMutex;
Log::Level g_minimumLevel = Log::Level::Info;
Log::Sink g_sink;

std::string toLowerAscii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

} // namespace

void Log::setLevel(Level level) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_minimumLevel = level;
}

bool Log::setLevelFromString(const std::string& levelText) {
    const std::string lowered = toLowerAscii(levelText);
    if (lowered == "debug") {
        setLevel(Level::Debug);
        return true;
    }
    if (lowered == "info") {
        setLevel(Level::Info);
        return true;
    }
    if (lowered == "warn" || lowered == "warning") {
        setLevel(Level::Warn);
        return true;
    }
    if (lowered == "error" || lowered == "quiet") {
        setLevel(Level::Error);
        return true;
    }
    return false;
}

Log::Level Log::level() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_minimumLevel;
}

void Log::setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_sink = std::move(sink);
}

void Log::debug(const std::string& message) {
    write(Level::Debug, message);
}

void Log::info(const std::string& message) {
    write(Level::Info, message);
}

void Log::warn(const std::string& message) {
    write(Level::Warn, message);
}

void Log::error(const std::string& message) {
    write(Level::Error, message);
}

const char* Log::label(Level level) {
    switch (level) {
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warn: return "WARN";
        case Level::Error: return "ERROR";
    }
    return "?";
}

void Log::write(Level level, const std::string& message) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (static_cast<int>(level) < static_cast<int>(g_minimumLevel)) {
        return;
    }

    if (g_sink) {
        g_sink(level, message);
        return;
    }

    std::ostream& out = (level >= Level::Warn) ? std::cerr : std::cout;
    out << '[' << timestamp() << "] [" << label(level) << "] " << message << std::endl;
}

std::string Log::timestamp() {
    using Clock = std::chrono::system_clock;
    const auto now = Clock::now();
    const std::time_t tt = Clock::to_time_t(now);

    std::tm tm{};
    localtime_r(&tt, &tm);

    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

} // namespace Jukebox

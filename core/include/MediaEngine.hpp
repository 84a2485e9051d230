#pragma once
#include <cstdint>
#include <memory>
#include <string>

namespace Jukebox {

/**
 * One native playback instance bound to one open audio file.
 *
 * A handle is driven by its playback session and, for live volume
 * changes, by MusicManager::setVolume from the caller's thread, so
 * implementations must be safe to call from two threads.
 */
class MediaHandle {
public:
    virtual ~MediaHandle() = default;

    // Returns false if the engine refuses to start
    virtual bool play() = 0;
    virtual void stop() = 0;
    virtual bool isPlaying() const = 0;

    // Position in milliseconds
    virtual int64_t getTime() const = 0;
    virtual void setTime(int64_t milliseconds) = 0;

    // 0 (mute) - 100
    virtual int getVolume() const = 0;
    virtual void setVolume(int volume) = 0;
};

class MediaEngine {
public:
    virtual ~MediaEngine() = default;

    // Opens the file. Throws EngineStartError if the engine cannot load it.
    virtual std::shared_ptr<MediaHandle> createPlayer(const std::string& path) = 0;
};

} // namespace Jukebox

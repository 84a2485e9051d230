#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <miniaudio.h>
#include "MediaEngine.hpp"

namespace Jukebox {

/**
 * MediaHandle on top of miniaudio: one ma_decoder reading the file and
 * one ma_device pulling from it in the data callback.
 */
class MiniaudioHandle : public MediaHandle {
public:
    explicit MiniaudioHandle(const std::string& path);
    ~MiniaudioHandle() override;

    MiniaudioHandle(const MiniaudioHandle&) = delete;
    MiniaudioHandle& operator=(const MiniaudioHandle&) = delete;

    bool play() override;
    void stop() override;
    bool isPlaying() const override;

    int64_t getTime() const override;
    void setTime(int64_t milliseconds) override;

    int getVolume() const override;
    void setVolume(int volume) override;

private:
    static void dataCallback(ma_device* pDevice, void* pOutput, const void* pInput, ma_uint32 frameCount);

    std::string m_path;
    ma_decoder m_decoder;
    ma_device m_device;

    // Decoder cursor is shared by the callback and seek/position queries
    mutable std::mutex m_decoderMutex;

    std::atomic<bool> m_started{false};
    std::atomic<bool> m_stopped{false};
    std::atomic<bool> m_atEnd{false};
    std::atomic<int> m_volume{100};
};

class MiniaudioEngine : public MediaEngine {
public:
    std::shared_ptr<MediaHandle> createPlayer(const std::string& path) override;
};

} // namespace Jukebox

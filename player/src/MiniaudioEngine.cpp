#define MINIAUDIO_IMPLEMENTATION
#include <miniaudio.h>

#include "MiniaudioEngine.hpp"
#include "Errors.hpp"
#include "Log.hpp"

#include <algorithm>

namespace Jukebox {

void MiniaudioHandle::dataCallback(ma_device* pDevice, void* pOutput, const void* pInput, ma_uint32 frameCount) {
    (void)pInput;
    MiniaudioHandle* handle = static_cast<MiniaudioHandle*>(pDevice->pUserData);
    if (handle == nullptr) return;

    // Output is pre-silenced by miniaudio, so a short read leaves silence
    ma_uint64 framesRead = 0;
    {
        std::lock_guard<std::mutex> lock(handle->m_decoderMutex);
        ma_decoder_read_pcm_frames(&handle->m_decoder, pOutput, frameCount, &framesRead);
    }

    if (framesRead < frameCount) {
        handle->m_atEnd = true;
    }
}

MiniaudioHandle::MiniaudioHandle(const std::string& path)
    : m_path(path) {
    ma_decoder_config decoderConfig = ma_decoder_config_init(ma_format_f32, 0, 0);
    ma_result result = ma_decoder_init_file(path.c_str(), &decoderConfig, &m_decoder);
    if (result != MA_SUCCESS) {
        throw EngineStartError("Failed to initialize decoder for " + path + " (" + ma_result_description(result) + ")");
    }

    ma_device_config deviceConfig = ma_device_config_init(ma_device_type_playback);
    deviceConfig.playback.format   = m_decoder.outputFormat;
    deviceConfig.playback.channels = m_decoder.outputChannels;
    deviceConfig.sampleRate        = m_decoder.outputSampleRate;
    deviceConfig.dataCallback      = dataCallback;
    deviceConfig.pUserData         = this;

    result = ma_device_init(NULL, &deviceConfig, &m_device);
    if (result != MA_SUCCESS) {
        ma_decoder_uninit(&m_decoder);
        throw EngineStartError("Failed to open playback device for " + path + " (" + ma_result_description(result) + ")");
    }

    Log::debug("[MiniaudioHandle] Opened " + path + " @ " + std::to_string(m_decoder.outputSampleRate) + " Hz, "
               + std::to_string(m_decoder.outputChannels) + " channels");
}

MiniaudioHandle::~MiniaudioHandle() {
    ma_device_uninit(&m_device);
    ma_decoder_uninit(&m_decoder);
}

bool MiniaudioHandle::play() {
    ma_device_set_master_volume(&m_device, m_volume / 100.0f);
    if (ma_device_start(&m_device) != MA_SUCCESS) {
        Log::error("[MiniaudioHandle] Failed to start playback device for " + m_path);
        return false;
    }
    m_stopped = false;
    m_started = true;
    return true;
}

void MiniaudioHandle::stop() {
    if (m_stopped.exchange(true)) return;
    if (m_started) {
        ma_device_stop(&m_device);
    }
}

bool MiniaudioHandle::isPlaying() const {
    return m_started && !m_stopped && !m_atEnd;
}

int64_t MiniaudioHandle::getTime() const {
    ma_uint64 cursor = 0;
    {
        std::lock_guard<std::mutex> lock(m_decoderMutex);
        ma_decoder_get_cursor_in_pcm_frames(const_cast<ma_decoder*>(&m_decoder), &cursor);
    }
    return static_cast<int64_t>(cursor * 1000 / m_decoder.outputSampleRate);
}

void MiniaudioHandle::setTime(int64_t milliseconds) {
    if (milliseconds < 0) milliseconds = 0;
    const ma_uint64 targetFrame = static_cast<ma_uint64>(milliseconds) * m_decoder.outputSampleRate / 1000;

    std::lock_guard<std::mutex> lock(m_decoderMutex);
    if (ma_decoder_seek_to_pcm_frame(&m_decoder, targetFrame) != MA_SUCCESS) {
        // Past the end of the file: nothing left to play
        Log::warn("[MiniaudioHandle] Cannot seek " + m_path + " to " + std::to_string(milliseconds) + " ms");
        m_atEnd = true;
        return;
    }
    m_atEnd = false;
}

int MiniaudioHandle::getVolume() const {
    return m_volume;
}

void MiniaudioHandle::setVolume(int volume) {
    m_volume = std::max(0, std::min(100, volume));
    ma_device_set_master_volume(&m_device, m_volume / 100.0f);
}

std::shared_ptr<MediaHandle> MiniaudioEngine::createPlayer(const std::string& path) {
    return std::make_shared<MiniaudioHandle>(path);
}

} // namespace Jukebox

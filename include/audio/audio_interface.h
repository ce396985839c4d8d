#pragma once

/**
 * @file audio_interface.h
 * @brief Audio device seams used by the capture link and playback queue
 *
 * The session never talks to PortAudio directly, so tests can drive capture
 * and playback with scripted devices.
 */

#include "common.h"
#include "errors.h"
#include <cstdint>
#include <functional>

namespace wayfarer {
namespace audio {

/**
 * @brief Microphone source delivering mono float samples in [-1, 1]
 */
class IMicrophone {
public:
    /// Called from the device thread with a block of captured samples
    using SamplesCallback = std::function<void(const float* samples, size_t count)>;

    virtual ~IMicrophone() = default;

    /**
     * @brief Acquire the device and start delivering samples
     * @return DeviceUnavailable error if the device cannot be opened or started
     */
    virtual Result<void> open(SamplesCallback on_samples) = 0;

    /**
     * @brief Stop delivery and release the device. Safe to call repeatedly.
     */
    virtual void close() = 0;

    virtual bool is_open() const = 0;

    virtual int sample_rate() const = 0;
};

/**
 * @brief Output device that plays segments at scheduled times on its own clock
 */
class IPlaybackDevice {
public:
    /// Called once when a scheduled segment has finished playing on its own
    using CompletionCallback = std::function<void(uint64_t segment_id)>;

    virtual ~IPlaybackDevice() = default;

    virtual Result<void> start(CompletionCallback on_complete) = 0;

    /// Current device time in seconds
    virtual double now() const = 0;

    /// Play samples beginning at start_time (device seconds)
    virtual void schedule(uint64_t segment_id, AudioBuffer samples, double start_time) = 0;

    /// Stop a segment immediately; no completion is reported for it
    virtual void stop(uint64_t segment_id) = 0;

    virtual void close() = 0;

    virtual int sample_rate() const = 0;
};

} // namespace audio
} // namespace wayfarer

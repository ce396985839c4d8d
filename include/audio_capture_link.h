#pragma once

#include "audio/audio_interface.h"
#include "common.h"
#include "errors.h"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace wayfarer {

/**
 * @brief Microphone to transcription-transport bridge
 *
 * Reframes device blocks into fixed-size frames, encodes each frame as
 * base64 PCM16-LE and hands it to the frame callback while armed.
 * Samples that arrive while disarmed are discarded, never buffered.
 */
class AudioCaptureLink {
public:
    using ChunkCallback = std::function<void(const EncodedChunk& chunk)>;

    struct Stats {
        uint64_t frames_forwarded = 0;
        uint64_t encode_failures = 0;
        uint64_t samples_dropped = 0;
    };

    AudioCaptureLink(std::shared_ptr<audio::IMicrophone> microphone,
                     ChunkCallback on_frame,
                     size_t frame_samples = CAPTURE_FRAME_SAMPLES);
    ~AudioCaptureLink();

    AudioCaptureLink(const AudioCaptureLink&) = delete;
    AudioCaptureLink& operator=(const AudioCaptureLink&) = delete;

    /**
     * @brief Acquire the microphone. The link starts disarmed.
     * @return DeviceUnavailable if the device cannot be opened,
     *         InvalidState after shutdown()
     */
    Result<void> start();

    void arm();

    /// Stop forwarding without releasing the device
    void disarm();

    bool is_armed() const { return armed_.load(); }

    /**
     * @brief Release the microphone and drop any partial frame.
     * Idempotent and safe from any state.
     */
    void shutdown();

    bool is_shut_down() const { return shut_down_.load(); }

    Stats stats() const;

    /**
     * @brief Encode float samples as base64 PCM16 little-endian
     *
     * Samples are clamped to [-1, 1]. A non-finite sample fails the whole frame.
     */
    static Result<EncodedChunk> encode_pcm16(const float* samples, size_t count, int sample_rate);

private:
    void on_samples(const float* samples, size_t count);

    std::shared_ptr<audio::IMicrophone> microphone_;
    ChunkCallback on_frame_;
    size_t frame_samples_;
    int sample_rate_;

    std::atomic<bool> armed_;
    std::atomic<bool> shut_down_;

    mutable std::mutex mutex_;
    std::vector<float> pending_;
    Stats stats_;
};

} // namespace wayfarer

#pragma once

#include "audio/audio_interface.h"
#include <string>
#include <memory>

namespace wayfarer {

/**
 * @brief Microphone input using PortAudio
 *
 * Opens a mono float32 input stream. Samples are delivered from PortAudio's
 * callback thread straight to the registered callback.
 */
class PortAudioMicrophone : public audio::IMicrophone {
public:
    /**
     * @param device Device name, numeric index, or "default"
     * @param sample_rate Capture rate in Hz (the transcription service expects 16000)
     * @param frames_per_buffer PortAudio callback block size
     */
    PortAudioMicrophone(const std::string& device, int sample_rate, int frames_per_buffer = 1024);
    ~PortAudioMicrophone() override;

    PortAudioMicrophone(const PortAudioMicrophone&) = delete;
    PortAudioMicrophone& operator=(const PortAudioMicrophone&) = delete;

    Result<void> open(SamplesCallback on_samples) override;
    void close() override;
    bool is_open() const override;
    int sample_rate() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

/**
 * @brief Scheduled-segment output using PortAudio
 *
 * The output callback mixes every segment whose start time has been reached.
 * Device time is the number of frames rendered so far divided by the rate.
 */
class PortAudioPlaybackDevice : public audio::IPlaybackDevice {
public:
    PortAudioPlaybackDevice(const std::string& device, int sample_rate);
    ~PortAudioPlaybackDevice() override;

    PortAudioPlaybackDevice(const PortAudioPlaybackDevice&) = delete;
    PortAudioPlaybackDevice& operator=(const PortAudioPlaybackDevice&) = delete;

    Result<void> start(CompletionCallback on_complete) override;
    double now() const override;
    void schedule(uint64_t segment_id, AudioBuffer samples, double start_time) override;
    void stop(uint64_t segment_id) override;
    void close() override;
    int sample_rate() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

/**
 * @brief PortAudio device helpers
 */
namespace audio_devices {

/// Log all available audio devices
void list_devices();

/**
 * @brief Resolve a device by "default", numeric index, or exact name
 * @return Device index, or -1 if not found. Pa_Initialize must already be active.
 */
int find_device(const std::string& name, bool is_input);

} // namespace audio_devices

} // namespace wayfarer

#include "audio_io.h"
#include "logger.h"
#include <portaudio.h>
#include <vector>
#include <mutex>
#include <atomic>
#include <cmath>
#include <cstring>
#include <sstream>
#include <algorithm>

namespace wayfarer {

namespace audio_devices {

void list_devices() {
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        Logger::error("PortAudio init error: " + std::string(Pa_GetErrorText(err)));
        return;
    }

    int num_devices = Pa_GetDeviceCount();
    Logger::info("Available audio devices:");

    for (int i = 0; i < num_devices; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info) continue;
        std::ostringstream oss;
        oss << "  [" << i << "] " << info->name;
        if (info->maxInputChannels > 0) oss << " (IN:" << info->maxInputChannels << ")";
        if (info->maxOutputChannels > 0) oss << " (OUT:" << info->maxOutputChannels << ")";
        oss << " default_rate=" << info->defaultSampleRate;
        Logger::info(oss.str());
    }

    Pa_Terminate();
}

int find_device(const std::string& name, bool is_input) {
    int num_devices = Pa_GetDeviceCount();

    if (name == "default" || name.empty()) {
        int default_idx = is_input ? Pa_GetDefaultInputDevice() : Pa_GetDefaultOutputDevice();
        return default_idx == paNoDevice ? -1 : default_idx;
    }

    // Numeric device index
    try {
        size_t consumed = 0;
        int device_idx = std::stoi(name, &consumed);
        if (consumed == name.size() && device_idx >= 0 && device_idx < num_devices) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(device_idx);
            if (info) {
                int channels = is_input ? info->maxInputChannels : info->maxOutputChannels;
                if (channels == 0) {
                    Logger::warn("Device [" + name + "] reports no " +
                                 std::string(is_input ? "input" : "output") + " channels, trying anyway");
                }
                return device_idx;
            }
        }
    } catch (const std::exception&) {
        // Not a number, continue to name matching
    }

    for (int i = 0; i < num_devices; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info || name != info->name) continue;
        int channels = is_input ? info->maxInputChannels : info->maxOutputChannels;
        if (channels > 0) {
            return i;
        }
    }

    return -1;
}

} // namespace audio_devices

// =============================================================================
// PortAudioMicrophone
// =============================================================================

class PortAudioMicrophone::Impl {
public:
    Impl(const std::string& device, int sample_rate, int frames_per_buffer)
        : device_(device), sample_rate_(sample_rate), frames_per_buffer_(frames_per_buffer) {}

    ~Impl() {
        close();
    }

    Result<void> open(SamplesCallback on_samples) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stream_) {
            return Result<void>();
        }

        PaError err = Pa_Initialize();
        if (err != paNoError) {
            return make_device_error("PortAudio init error: " + std::string(Pa_GetErrorText(err)));
        }

        int input_idx = audio_devices::find_device(device_, true);
        const PaDeviceInfo* info = input_idx >= 0 ? Pa_GetDeviceInfo(input_idx) : nullptr;
        if (!info) {
            Pa_Terminate();
            return make_device_error("Input device not found: " + device_);
        }
        if (info->maxInputChannels == 0) {
            Pa_Terminate();
            return make_device_error(std::string("Device has no input channels: ") + info->name);
        }

        PaStreamParameters input_params;
        input_params.device = input_idx;
        input_params.channelCount = 1;
        input_params.sampleFormat = paFloat32;
        input_params.suggestedLatency = info->defaultLowInputLatency;
        input_params.hostApiSpecificStreamInfo = nullptr;

        on_samples_ = std::move(on_samples);

        err = Pa_OpenStream(&stream_, &input_params, nullptr, sample_rate_,
                            frames_per_buffer_, paClipOff, input_callback, this);
        if (err != paNoError) {
            stream_ = nullptr;
            Pa_Terminate();
            return make_device_error("Failed to open input stream: " + std::string(Pa_GetErrorText(err)));
        }

        err = Pa_StartStream(stream_);
        if (err != paNoError) {
            std::string message = "Failed to start input stream: " + std::string(Pa_GetErrorText(err));
            if (err == paUnanticipatedHostError) {
                message += " (check microphone permissions)";
            }
            Pa_CloseStream(stream_);
            stream_ = nullptr;
            Pa_Terminate();
            return make_device_error(message);
        }

        std::ostringstream oss;
        oss << "Microphone open: [" << input_idx << "] " << info->name << " @ " << sample_rate_ << "Hz";
        LOG_CAPTURE(oss.str());
        return Result<void>();
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!stream_) {
            return;
        }
        Pa_StopStream(stream_);
        Pa_CloseStream(stream_);
        stream_ = nullptr;
        Pa_Terminate();
        LOG_CAPTURE("Microphone released");
    }

    bool is_open() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stream_ != nullptr;
    }

    int sample_rate() const { return sample_rate_; }

private:
    static int input_callback(const void* input, void* output,
                              unsigned long frame_count,
                              const PaStreamCallbackTimeInfo* time_info,
                              PaStreamCallbackFlags status_flags,
                              void* user_data) {
        (void)output;
        (void)time_info;
        (void)status_flags;
        Impl* self = static_cast<Impl*>(user_data);
        if (input && self->on_samples_) {
            self->on_samples_(static_cast<const float*>(input), frame_count);
        }
        return paContinue;
    }

    std::string device_;
    int sample_rate_;
    int frames_per_buffer_;
    PaStream* stream_ = nullptr;
    SamplesCallback on_samples_;
    mutable std::mutex mutex_;
};

PortAudioMicrophone::PortAudioMicrophone(const std::string& device, int sample_rate, int frames_per_buffer)
    : pimpl_(std::make_unique<Impl>(device, sample_rate, frames_per_buffer)) {}

PortAudioMicrophone::~PortAudioMicrophone() = default;

Result<void> PortAudioMicrophone::open(SamplesCallback on_samples) {
    return pimpl_->open(std::move(on_samples));
}

void PortAudioMicrophone::close() {
    pimpl_->close();
}

bool PortAudioMicrophone::is_open() const {
    return pimpl_->is_open();
}

int PortAudioMicrophone::sample_rate() const {
    return pimpl_->sample_rate();
}

// =============================================================================
// PortAudioPlaybackDevice
// =============================================================================

class PortAudioPlaybackDevice::Impl {
public:
    Impl(const std::string& device, int sample_rate)
        : device_(device), sample_rate_(sample_rate), frames_rendered_(0) {}

    ~Impl() {
        close();
    }

    Result<void> start(CompletionCallback on_complete) {
        std::lock_guard<std::mutex> lock(stream_mutex_);
        if (stream_) {
            return Result<void>();
        }

        PaError err = Pa_Initialize();
        if (err != paNoError) {
            return make_device_error("PortAudio init error: " + std::string(Pa_GetErrorText(err)));
        }

        int output_idx = audio_devices::find_device(device_, false);
        const PaDeviceInfo* info = output_idx >= 0 ? Pa_GetDeviceInfo(output_idx) : nullptr;
        if (!info) {
            Pa_Terminate();
            return make_device_error("Output device not found: " + device_);
        }

        PaStreamParameters output_params;
        output_params.device = output_idx;
        output_params.channelCount = 1;
        output_params.sampleFormat = paInt16;
        output_params.suggestedLatency = info->defaultLowOutputLatency;
        output_params.hostApiSpecificStreamInfo = nullptr;

        {
            std::lock_guard<std::mutex> seg_lock(segments_mutex_);
            on_complete_ = std::move(on_complete);
        }

        err = Pa_OpenStream(&stream_, nullptr, &output_params, sample_rate_,
                            PLAYBACK_CALLBACK_FRAMES, paClipOff, output_callback, this);
        if (err != paNoError) {
            stream_ = nullptr;
            Pa_Terminate();
            return make_device_error("Failed to open output stream: " + std::string(Pa_GetErrorText(err)));
        }

        err = Pa_StartStream(stream_);
        if (err != paNoError) {
            Pa_CloseStream(stream_);
            stream_ = nullptr;
            Pa_Terminate();
            return make_device_error("Failed to start output stream: " + std::string(Pa_GetErrorText(err)));
        }

        LOG_PLAYBACK(std::string("Output open: [") + std::to_string(output_idx) + "] " + info->name);
        return Result<void>();
    }

    double now() const {
        return static_cast<double>(frames_rendered_.load()) / static_cast<double>(sample_rate_);
    }

    void schedule(uint64_t segment_id, AudioBuffer samples, double start_time) {
        std::lock_guard<std::mutex> lock(segments_mutex_);
        Segment seg;
        seg.id = segment_id;
        seg.start_frame = static_cast<uint64_t>(std::llround(std::max(0.0, start_time) * sample_rate_));
        seg.samples = std::move(samples);
        segments_.push_back(std::move(seg));
    }

    void stop(uint64_t segment_id) {
        std::lock_guard<std::mutex> lock(segments_mutex_);
        segments_.erase(std::remove_if(segments_.begin(), segments_.end(),
                                       [segment_id](const Segment& s) { return s.id == segment_id; }),
                        segments_.end());
    }

    void close() {
        std::lock_guard<std::mutex> lock(stream_mutex_);
        if (stream_) {
            Pa_StopStream(stream_);
            Pa_CloseStream(stream_);
            stream_ = nullptr;
            Pa_Terminate();
            LOG_PLAYBACK("Output closed");
        }
        std::lock_guard<std::mutex> seg_lock(segments_mutex_);
        segments_.clear();
    }

    int sample_rate() const { return sample_rate_; }

private:
    struct Segment {
        uint64_t id = 0;
        uint64_t start_frame = 0;
        AudioBuffer samples;
    };

    static int output_callback(const void* input, void* output,
                               unsigned long frame_count,
                               const PaStreamCallbackTimeInfo* time_info,
                               PaStreamCallbackFlags status_flags,
                               void* user_data) {
        (void)input;
        (void)time_info;
        (void)status_flags;
        Impl* self = static_cast<Impl*>(user_data);
        Sample* out = static_cast<Sample*>(output);

        std::vector<uint64_t> finished;
        CompletionCallback on_complete;
        {
            std::lock_guard<std::mutex> lock(self->segments_mutex_);
            self->mix_buffer_.assign(frame_count, 0);

            uint64_t base = self->frames_rendered_.load();
            uint64_t end = base + frame_count;

            for (auto it = self->segments_.begin(); it != self->segments_.end();) {
                uint64_t seg_end = it->start_frame + it->samples.size();
                uint64_t from = std::max(base, it->start_frame);
                uint64_t to = std::min(end, seg_end);
                for (uint64_t f = from; f < to; ++f) {
                    self->mix_buffer_[f - base] += it->samples[f - it->start_frame];
                }
                if (seg_end <= end) {
                    finished.push_back(it->id);
                    it = self->segments_.erase(it);
                } else {
                    ++it;
                }
            }

            for (unsigned long i = 0; i < frame_count; ++i) {
                out[i] = static_cast<Sample>(std::clamp(self->mix_buffer_[i], -32768, 32767));
            }
            on_complete = self->on_complete_;
        }

        self->frames_rendered_ += frame_count;

        if (on_complete) {
            for (uint64_t id : finished) {
                on_complete(id);
            }
        }
        return paContinue;
    }

    std::string device_;
    int sample_rate_;
    PaStream* stream_ = nullptr;
    std::atomic<uint64_t> frames_rendered_;

    std::mutex stream_mutex_;
    std::mutex segments_mutex_;
    std::vector<Segment> segments_;
    std::vector<int32_t> mix_buffer_;
    CompletionCallback on_complete_;
};

PortAudioPlaybackDevice::PortAudioPlaybackDevice(const std::string& device, int sample_rate)
    : pimpl_(std::make_unique<Impl>(device, sample_rate)) {}

PortAudioPlaybackDevice::~PortAudioPlaybackDevice() = default;

Result<void> PortAudioPlaybackDevice::start(CompletionCallback on_complete) {
    return pimpl_->start(std::move(on_complete));
}

double PortAudioPlaybackDevice::now() const {
    return pimpl_->now();
}

void PortAudioPlaybackDevice::schedule(uint64_t segment_id, AudioBuffer samples, double start_time) {
    pimpl_->schedule(segment_id, std::move(samples), start_time);
}

void PortAudioPlaybackDevice::stop(uint64_t segment_id) {
    pimpl_->stop(segment_id);
}

void PortAudioPlaybackDevice::close() {
    pimpl_->close();
}

int PortAudioPlaybackDevice::sample_rate() const {
    return pimpl_->sample_rate();
}

} // namespace wayfarer

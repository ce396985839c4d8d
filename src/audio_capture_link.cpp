#include "audio_capture_link.h"
#include "logger.h"
#include <websocketpp/base64/base64.hpp>
#include <algorithm>
#include <cmath>

namespace wayfarer {

AudioCaptureLink::AudioCaptureLink(std::shared_ptr<audio::IMicrophone> microphone,
                                   ChunkCallback on_frame,
                                   size_t frame_samples)
    : microphone_(std::move(microphone)),
      on_frame_(std::move(on_frame)),
      frame_samples_(frame_samples > 0 ? frame_samples : CAPTURE_FRAME_SAMPLES),
      sample_rate_(microphone_ ? microphone_->sample_rate() : CAPTURE_SAMPLE_RATE),
      armed_(false),
      shut_down_(false) {
    pending_.reserve(frame_samples_);
}

AudioCaptureLink::~AudioCaptureLink() {
    shutdown();
}

Result<void> AudioCaptureLink::start() {
    if (shut_down_) {
        return make_error(ErrorType::InvalidState, "capture link already shut down");
    }
    if (!microphone_) {
        return make_device_error("no microphone configured");
    }
    if (microphone_->is_open()) {
        return Result<void>();
    }
    return microphone_->open([this](const float* samples, size_t count) {
        on_samples(samples, count);
    });
}

void AudioCaptureLink::arm() {
    if (shut_down_) {
        return;
    }
    if (!armed_.exchange(true)) {
        LOG_CAPTURE("Capture armed");
    }
}

void AudioCaptureLink::disarm() {
    if (armed_.exchange(false)) {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.samples_dropped += pending_.size();
        pending_.clear();
        LOG_CAPTURE("Capture disarmed");
    }
}

void AudioCaptureLink::shutdown() {
    if (shut_down_.exchange(true)) {
        return;
    }
    armed_ = false;
    if (microphone_) {
        microphone_->close();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.clear();
    LOG_CAPTURE("Capture shut down (forwarded=" + std::to_string(stats_.frames_forwarded) +
                ", encode_failures=" + std::to_string(stats_.encode_failures) + ")");
}

AudioCaptureLink::Stats AudioCaptureLink::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void AudioCaptureLink::on_samples(const float* samples, size_t count) {
    if (!samples || count == 0) {
        return;
    }

    std::vector<EncodedChunk> ready;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!armed_ || shut_down_) {
            stats_.samples_dropped += count;
            return;
        }

        size_t offset = 0;
        while (offset < count) {
            size_t take = std::min(frame_samples_ - pending_.size(), count - offset);
            pending_.insert(pending_.end(), samples + offset, samples + offset + take);
            offset += take;

            if (pending_.size() < frame_samples_) {
                break;
            }

            auto encoded = encode_pcm16(pending_.data(), pending_.size(), sample_rate_);
            pending_.clear();
            if (encoded.is_error()) {
                stats_.encode_failures++;
                Logger::warn("Capture frame skipped: " + encoded.error().message);
                continue;
            }
            stats_.frames_forwarded++;
            ready.push_back(std::move(encoded.value()));
        }
    }

    if (on_frame_) {
        for (const auto& chunk : ready) {
            on_frame_(chunk);
        }
    }
}

Result<EncodedChunk> AudioCaptureLink::encode_pcm16(const float* samples, size_t count, int sample_rate) {
    if (!samples || count == 0) {
        return make_encoding_error("empty frame");
    }

    std::string bytes;
    bytes.resize(count * 2);
    for (size_t i = 0; i < count; ++i) {
        float v = samples[i];
        if (!std::isfinite(v)) {
            return make_encoding_error("non-finite sample at index " + std::to_string(i));
        }
        v = std::clamp(v, -1.0f, 1.0f);
        int16_t s = static_cast<int16_t>(std::lround(v * 32767.0f));
        uint16_t u = static_cast<uint16_t>(s);
        bytes[2 * i] = static_cast<char>(u & 0xFF);
        bytes[2 * i + 1] = static_cast<char>((u >> 8) & 0xFF);
    }

    EncodedChunk chunk;
    chunk.mime_type = "audio/pcm;rate=" + std::to_string(sample_rate);
    chunk.data = websocketpp::base64_encode(reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size());
    chunk.sample_count = count;
    return chunk;
}

} // namespace wayfarer

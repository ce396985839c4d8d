#include "audio_playback_queue.h"
#include "logger.h"
#include <algorithm>

namespace wayfarer {

AudioPlaybackQueue::AudioPlaybackQueue(std::shared_ptr<audio::IPlaybackDevice> device)
    : device_(std::move(device)) {}

AudioPlaybackQueue::~AudioPlaybackQueue() {
    close();
}

Result<void> AudioPlaybackQueue::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return make_error(ErrorType::InvalidState, "playback queue closed");
    }
    if (started_) {
        return Result<void>();
    }
    if (!device_) {
        return make_device_error("no playback device configured");
    }

    auto result = device_->start([this](uint64_t segment_id) {
        on_segment_complete(segment_id);
    });
    if (result.is_error()) {
        return result;
    }
    started_ = true;
    next_start_ = device_->now();
    return Result<void>();
}

uint64_t AudioPlaybackQueue::enqueue(AudioBuffer segment) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || !started_ || segment.empty()) {
        return 0;
    }

    double now = device_->now();
    double start_time = std::max(next_start_, now);
    double duration = static_cast<double>(segment.size()) / device_->sample_rate();

    uint64_t id = ++next_id_;
    device_->schedule(id, std::move(segment), start_time);
    next_start_ = start_time + duration;
    active_.insert(id);

    LOG_PLAYBACK("Segment " + std::to_string(id) + " scheduled at " + std::to_string(start_time) +
                 "s (" + std::to_string(duration) + "s)");
    return id;
}

void AudioPlaybackQueue::cancel_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!started_) {
        return;
    }
    for (uint64_t id : active_) {
        device_->stop(id);
    }
    if (!active_.empty()) {
        LOG_PLAYBACK("Cancelled " + std::to_string(active_.size()) + " segment(s)");
    }
    active_.clear();
    next_start_ = device_->now();
}

void AudioPlaybackQueue::on_segment_complete(uint64_t segment_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_.erase(segment_id);
}

size_t AudioPlaybackQueue::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

double AudioPlaybackQueue::next_start() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_start_;
}

void AudioPlaybackQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        if (started_) {
            for (uint64_t id : active_) {
                device_->stop(id);
            }
        }
        active_.clear();
    }
    // Outside the lock: the device may be delivering a completion right now
    if (started_ && device_) {
        device_->close();
    }
}

} // namespace wayfarer

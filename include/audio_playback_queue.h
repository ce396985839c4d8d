#pragma once

#include "audio/audio_interface.h"
#include "common.h"
#include "errors.h"
#include <memory>
#include <mutex>
#include <set>

namespace wayfarer {

/**
 * @brief Gapless sequential playback of decoded service audio
 *
 * Each segment is scheduled at max(next_start, now) on the device clock and
 * pushes next_start forward by its duration. cancel_all() is the barge-in
 * path: every active segment is stopped before it returns, so a segment
 * enqueued afterwards starts immediately.
 */
class AudioPlaybackQueue {
public:
    explicit AudioPlaybackQueue(std::shared_ptr<audio::IPlaybackDevice> device);
    ~AudioPlaybackQueue();

    AudioPlaybackQueue(const AudioPlaybackQueue&) = delete;
    AudioPlaybackQueue& operator=(const AudioPlaybackQueue&) = delete;

    /// Open the output device and reset the schedule to the device clock
    Result<void> start();

    /**
     * @brief Schedule a segment after everything already queued
     * @return Segment id, or 0 when the segment is empty or the queue is closed
     */
    uint64_t enqueue(AudioBuffer segment);

    /// Stop every active segment and reset next_start to now
    void cancel_all();

    /// Natural completion from the device; removes the segment from the active set
    void on_segment_complete(uint64_t segment_id);

    size_t active_count() const;
    double next_start() const;

    /// Cancel everything and release the device. Idempotent.
    void close();

private:
    std::shared_ptr<audio::IPlaybackDevice> device_;
    mutable std::mutex mutex_;
    std::set<uint64_t> active_;
    double next_start_ = 0.0;
    uint64_t next_id_ = 0;
    bool started_ = false;
    bool closed_ = false;
};

} // namespace wayfarer

#pragma once

#include "backend_client.h"
#include "common.h"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace wayfarer {

/**
 * @brief One input to the session state machine
 *
 * Every asynchronous source (microphone, transcription socket, speech output,
 * backend worker, user commands) is reduced to one of these. generation tags
 * the session the event belongs to; events from an earlier session are dropped.
 */
struct SessionEvent {
    enum class Type {
        StartRequested,
        StopRequested,
        SpeechMuteChanged,
        TransportOpened,
        PartialText,
        TurnBoundary,
        ServiceAudio,
        Interrupted,
        TransportClosed,
        TransportError,
        AudioChunkReady,
        SpeechStarted,
        SpeechEnded,
        DispatchCompleted
    };

    Type type = Type::StopRequested;
    uint64_t generation = 0;

    std::string text;                 ///< transcript text, stop/close reason, error message
    int code = 0;                     ///< transport close code
    bool flag = false;                ///< SpeechMuteChanged: muted
    uint64_t utterance_id = 0;
    AudioBuffer audio;                ///< ServiceAudio
    EncodedChunk chunk;               ///< AudioChunkReady
    std::optional<Result<BackendResult>> dispatch_result;  ///< DispatchCompleted
};

inline const char* session_event_name(SessionEvent::Type type) {
    switch (type) {
        case SessionEvent::Type::StartRequested: return "StartRequested";
        case SessionEvent::Type::StopRequested: return "StopRequested";
        case SessionEvent::Type::SpeechMuteChanged: return "SpeechMuteChanged";
        case SessionEvent::Type::TransportOpened: return "TransportOpened";
        case SessionEvent::Type::PartialText: return "PartialText";
        case SessionEvent::Type::TurnBoundary: return "TurnBoundary";
        case SessionEvent::Type::ServiceAudio: return "ServiceAudio";
        case SessionEvent::Type::Interrupted: return "Interrupted";
        case SessionEvent::Type::TransportClosed: return "TransportClosed";
        case SessionEvent::Type::TransportError: return "TransportError";
        case SessionEvent::Type::AudioChunkReady: return "AudioChunkReady";
        case SessionEvent::Type::SpeechStarted: return "SpeechStarted";
        case SessionEvent::Type::SpeechEnded: return "SpeechEnded";
        case SessionEvent::Type::DispatchCompleted: return "DispatchCompleted";
    }
    return "Unknown";
}

/**
 * @brief Thread-safe FIFO feeding the session's single event path
 *
 * Held by shared_ptr so device, socket and worker threads can keep posting
 * after the session object is gone; posts after shutdown() are dropped.
 */
class SessionEventQueue {
public:
    /// @return false if the queue has been shut down
    bool post(SessionEvent event) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shut_down_) {
                return false;
            }
            events_.push_back(std::move(event));
        }
        cv_.notify_one();
        return true;
    }

    std::optional<SessionEvent> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (events_.empty()) {
            return std::nullopt;
        }
        SessionEvent ev = std::move(events_.front());
        events_.pop_front();
        return ev;
    }

    /// Wait up to timeout for an event; returns nullopt on timeout or shutdown
    std::optional<SessionEvent> wait_pop(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !events_.empty() || shut_down_; });
        if (events_.empty()) {
            return std::nullopt;
        }
        SessionEvent ev = std::move(events_.front());
        events_.pop_front();
        return ev;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.size();
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shut_down_ = true;
        }
        cv_.notify_all();
    }

    bool is_shut_down() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return shut_down_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<SessionEvent> events_;
    bool shut_down_ = false;
};

} // namespace wayfarer

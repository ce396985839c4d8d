#pragma once

#include "audio/audio_interface.h"
#include "backend_client.h"
#include "config.h"
#include "dispatch_executor.h"
#include "errors.h"
#include "session_event.h"
#include "session_state.h"
#include "transcript.h"
#include "transcription_link.h"
#include "tts/speech_engine.h"
#include "visual_state.h"
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace wayfarer {

/**
 * @brief External pieces a voice session drives
 *
 * speech may be null (spoken replies disabled); playback is only required
 * when session.play_service_audio is set.
 */
struct SessionCollaborators {
    std::shared_ptr<ITranscriptionTransport> transport;
    std::shared_ptr<audio::IMicrophone> microphone;
    std::shared_ptr<audio::IPlaybackDevice> playback;
    std::shared_ptr<tts::ISpeechEngine> speech;
    std::shared_ptr<IBackendClient> backend;
    std::shared_ptr<IDispatchExecutor> executor;
    std::shared_ptr<ITranscriptSink> transcript;
    std::shared_ptr<IVisualStateSink> visual;
};

/**
 * @brief Voice session state machine
 *
 * All inputs are posted to one event queue and applied one at a time by
 * whichever thread calls process_pending()/process_next(). Public request
 * methods only post; they never mutate session state directly.
 *
 * Guarantees:
 * - At most one backend dispatch in flight per session.
 * - A turn is finalized before it is dispatched.
 * - Capture is disarmed from speech start until the matching speech end.
 * - close is idempotent; results that arrive after close are discarded.
 */
class SessionOrchestrator {
public:
    using ClosedCallback = std::function<void(const std::string& reason)>;

    SessionOrchestrator(const Config& config,
                        SessionCollaborators collaborators,
                        ClosedCallback on_closed = nullptr);
    ~SessionOrchestrator();

    SessionOrchestrator(const SessionOrchestrator&) = delete;
    SessionOrchestrator& operator=(const SessionOrchestrator&) = delete;

    /**
     * @brief Request a new session (new session id, fresh turn state)
     * @return InvalidState if a session is already running
     */
    Result<void> start();

    /// Request close with a reason for on_closed
    void stop(const std::string& reason = "stopped by user");

    void mute_speech();
    void unmute_speech();
    /// @return New muted state
    bool toggle_speech_mute();
    bool is_speech_muted() const;

    /// Apply every queued event; returns how many were handled
    size_t process_pending();

    /// Wait up to timeout for one event and apply it
    bool process_next(std::chrono::milliseconds timeout);

    /**
     * @brief Close any running session and stop accepting events.
     * Must be called from the thread that processes events (or after it stopped).
     */
    void shutdown();

    SessionState state() const;
    std::string session_id() const;
    bool is_dispatch_in_flight() const;
    std::string last_dispatched_text() const;

    /// Queue shared with every event source of this orchestrator
    std::shared_ptr<SessionEventQueue> event_queue() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace wayfarer

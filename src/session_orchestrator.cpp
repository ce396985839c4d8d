#include "session_orchestrator.h"
#include "audio_capture_link.h"
#include "audio_playback_queue.h"
#include "logger.h"
#include "speech_output_gate.h"
#include "transcript_accumulator.h"
#include "utils.h"
#include <atomic>
#include <deque>
#include <mutex>

namespace wayfarer {

class SessionOrchestrator::Impl {
public:
    Impl(const Config& config, SessionCollaborators collaborators, ClosedCallback on_closed)
        : config_(config)
        , collab_(std::move(collaborators))
        , on_closed_(std::move(on_closed))
        , queue_(std::make_shared<SessionEventQueue>())
        , state_(SessionState::Idle)
        , start_pending_(false)
        , speech_muted_(config.speech.start_muted)
        , dispatch_in_flight_(false)
    {
    }

    ~Impl() {
        shutdown();
    }

    // =========================================================================
    // Requests (any thread)
    // =========================================================================

    Result<void> start() {
        SessionState s = state_;
        if (s != SessionState::Idle && s != SessionState::Closed) {
            return make_error(ErrorType::InvalidState,
                              std::string("session already running (") + session_state_name(s) + ")");
        }
        if (start_pending_.exchange(true)) {
            return make_error(ErrorType::InvalidState, "session start already requested");
        }
        SessionEvent ev;
        ev.type = SessionEvent::Type::StartRequested;
        if (!queue_->post(std::move(ev))) {
            start_pending_ = false;
            return make_error(ErrorType::InvalidState, "session orchestrator shut down");
        }
        return Result<void>();
    }

    void stop(const std::string& reason) {
        SessionEvent ev;
        ev.type = SessionEvent::Type::StopRequested;
        ev.text = reason;
        queue_->post(std::move(ev));
    }

    void set_speech_muted(bool muted) {
        speech_muted_ = muted;
        SessionEvent ev;
        ev.type = SessionEvent::Type::SpeechMuteChanged;
        ev.flag = muted;
        queue_->post(std::move(ev));
    }

    bool toggle_speech_mute() {
        bool muted = !speech_muted_.load();
        set_speech_muted(muted);
        return muted;
    }

    bool is_speech_muted() const { return speech_muted_; }

    // =========================================================================
    // Event loop
    // =========================================================================

    size_t process_pending() {
        size_t handled = 0;
        while (auto ev = queue_->try_pop()) {
            handle(*ev);
            handled++;
        }
        return handled;
    }

    bool process_next(std::chrono::milliseconds timeout) {
        auto ev = queue_->wait_pop(timeout);
        if (!ev) {
            return false;
        }
        handle(*ev);
        return true;
    }

    void shutdown() {
        if (queue_->is_shut_down()) {
            return;
        }
        close_session("shutting down");
        queue_->shutdown();
    }

    // =========================================================================
    // Accessors
    // =========================================================================

    SessionState state() const { return state_; }

    std::string session_id() const {
        std::lock_guard<std::mutex> lock(session_mutex_);
        return session_id_;
    }

    bool is_dispatch_in_flight() const { return dispatch_in_flight_; }

    std::string last_dispatched_text() const {
        std::lock_guard<std::mutex> lock(session_mutex_);
        return last_dispatched_text_;
    }

    std::shared_ptr<SessionEventQueue> event_queue() const { return queue_; }

private:
    /// Everything owned by one session; rebuilt on every start
    struct Session {
        uint64_t generation = 0;
        std::unique_ptr<AudioCaptureLink> capture;
        std::unique_ptr<AudioPlaybackQueue> playback;
        std::unique_ptr<SpeechOutputGate> gate;
        std::unique_ptr<TranscriptAccumulator> accumulator;
        ViewMode previous_mode = ViewMode::Search;
        std::deque<std::string> deferred_turns;  ///< Finalized turns waiting for the in-flight dispatch
        uint64_t turn_id = 0;
    };

    void set_state(SessionState next) {
        SessionState prev = state_.exchange(next);
        if (prev != next) {
            LOG_SESSION(std::string(session_state_name(prev)) + " -> " + session_state_name(next));
        }
    }

    void handle(const SessionEvent& ev) {
        switch (ev.type) {
            case SessionEvent::Type::StartRequested:
                on_start_requested();
                return;
            case SessionEvent::Type::StopRequested:
                close_session(ev.text);
                return;
            case SessionEvent::Type::SpeechMuteChanged:
                if (session_ && session_->gate) {
                    if (ev.flag) {
                        session_->gate->mute();
                    } else {
                        session_->gate->unmute();
                    }
                }
                return;
            default:
                break;
        }

        if (!session_ || ev.generation != session_->generation) {
            Logger::debug(std::string("Stale event dropped: ") + session_event_name(ev.type));
            return;
        }

        switch (ev.type) {
            case SessionEvent::Type::TransportOpened:
                on_transport_opened();
                break;
            case SessionEvent::Type::PartialText:
                on_partial_text(ev.text);
                break;
            case SessionEvent::Type::TurnBoundary:
                on_turn_boundary();
                break;
            case SessionEvent::Type::ServiceAudio:
                on_service_audio(ev.audio);
                break;
            case SessionEvent::Type::Interrupted:
                if (is_session_active(state_) && session_->playback) {
                    LOG_SESSION("Interrupted: cancelling playback");
                    session_->playback->cancel_all();
                }
                break;
            case SessionEvent::Type::TransportClosed:
                close_session("transcription transport closed (code " + std::to_string(ev.code) + "): " + ev.text);
                break;
            case SessionEvent::Type::TransportError:
                close_session("transcription transport error: " + ev.text);
                break;
            case SessionEvent::Type::AudioChunkReady:
                on_audio_chunk(ev.chunk);
                break;
            case SessionEvent::Type::SpeechStarted:
                if (is_session_active(state_)) {
                    session_->capture->disarm();
                }
                break;
            case SessionEvent::Type::SpeechEnded:
                if (is_session_active(state_)) {
                    session_->capture->arm();
                }
                break;
            case SessionEvent::Type::DispatchCompleted:
                on_dispatch_completed(ev);
                break;
            default:
                break;
        }
    }

    // =========================================================================
    // Lifecycle
    // =========================================================================

    void on_start_requested() {
        start_pending_ = false;
        SessionState s = state_;
        if (s != SessionState::Idle && s != SessionState::Closed) {
            Logger::warn(std::string("Start ignored in state ") + session_state_name(s));
            return;
        }

        uint64_t gen = ++generation_;
        std::shared_ptr<SessionEventQueue> queue = queue_;

        auto session = std::make_unique<Session>();
        session->generation = gen;
        session->accumulator = std::make_unique<TranscriptAccumulator>(collab_.transcript);
        session->capture = std::make_unique<AudioCaptureLink>(
            collab_.microphone,
            [queue, gen](const EncodedChunk& chunk) {
                SessionEvent ev;
                ev.type = SessionEvent::Type::AudioChunkReady;
                ev.generation = gen;
                ev.chunk = chunk;
                queue->post(std::move(ev));
            },
            static_cast<size_t>(config_.audio.frame_samples));
        if (config_.session.play_service_audio && collab_.playback) {
            session->playback = std::make_unique<AudioPlaybackQueue>(collab_.playback);
        }

        SpeechOutputGate::Callbacks gate_callbacks;
        gate_callbacks.on_start = [queue, gen](uint64_t utterance_id) {
            SessionEvent ev;
            ev.type = SessionEvent::Type::SpeechStarted;
            ev.generation = gen;
            ev.utterance_id = utterance_id;
            queue->post(std::move(ev));
        };
        gate_callbacks.on_end = [queue, gen](uint64_t utterance_id) {
            SessionEvent ev;
            ev.type = SessionEvent::Type::SpeechEnded;
            ev.generation = gen;
            ev.utterance_id = utterance_id;
            queue->post(std::move(ev));
        };
        session->gate = std::make_unique<SpeechOutputGate>(collab_.speech, std::move(gate_callbacks),
                                                           speech_muted_.load());

        session_ = std::move(session);
        dispatch_in_flight_ = false;
        {
            std::lock_guard<std::mutex> lock(session_mutex_);
            session_id_ = utils::make_session_id(config_.session.session_id_prefix);
            last_dispatched_text_.clear();
        }
        LOG_SESSION("Starting session " + session_id());

        if (collab_.visual) {
            collab_.visual->set_visual_data(nlohmann::json());
            collab_.visual->set_view_mode(ViewMode::Search);
        }
        current_mode_ = ViewMode::Search;

        set_state(SessionState::Connecting);

        if (config_.session.play_service_audio) {
            if (!session_->playback) {
                close_session("audio output unavailable: no playback device");
                return;
            }
            auto playback = session_->playback->start();
            if (playback.is_error()) {
                close_session("audio output unavailable: " + playback.error().message);
                return;
            }
        }

        auto mic = session_->capture->start();
        if (mic.is_error()) {
            Logger::error("Microphone acquisition failed: " + mic.error().message);
            close_session("microphone unavailable: " + mic.error().message);
            return;
        }

        if (!collab_.transport) {
            close_session("transcription transport error: no transport configured");
            return;
        }
        auto connected = collab_.transport->connect([queue, gen](const TranscriptionEvent& tev) {
            queue->post(to_session_event(tev, gen));
        });
        if (connected.is_error()) {
            close_session("transcription transport error: " + connected.error().message);
            return;
        }
    }

    static SessionEvent to_session_event(const TranscriptionEvent& tev, uint64_t gen) {
        SessionEvent ev;
        ev.generation = gen;
        switch (tev.type) {
            case TranscriptionEvent::Type::Opened:
                ev.type = SessionEvent::Type::TransportOpened;
                break;
            case TranscriptionEvent::Type::PartialText:
                ev.type = SessionEvent::Type::PartialText;
                ev.text = tev.text;
                break;
            case TranscriptionEvent::Type::TurnBoundary:
                ev.type = SessionEvent::Type::TurnBoundary;
                ev.text = tev.text;
                break;
            case TranscriptionEvent::Type::ServiceAudio:
                ev.type = SessionEvent::Type::ServiceAudio;
                ev.audio = tev.audio;
                break;
            case TranscriptionEvent::Type::Interrupted:
                ev.type = SessionEvent::Type::Interrupted;
                break;
            case TranscriptionEvent::Type::Closed:
                ev.type = SessionEvent::Type::TransportClosed;
                ev.code = tev.code;
                ev.text = tev.text;
                break;
            case TranscriptionEvent::Type::Error:
                ev.type = SessionEvent::Type::TransportError;
                ev.text = tev.text;
                break;
        }
        return ev;
    }

    void on_transport_opened() {
        if (state_ != SessionState::Connecting) {
            return;
        }
        session_->capture->arm();
        set_state(SessionState::Listening);
    }

    /**
     * Closing order: flush the unfinished turn, stop capture, drop queued
     * audio, cut off speech, then release the transport.
     */
    void close_session(const std::string& reason) {
        SessionState s = state_;
        if (!session_ || s == SessionState::Idle || s == SessionState::Closing || s == SessionState::Closed) {
            return;
        }
        set_state(SessionState::Closing);
        LOG_SESSION("Closing session " + session_id() + ": " + reason);

        if (session_->accumulator->has_pending_text()) {
            session_->accumulator->finalize();
        }
        session_->capture->shutdown();
        if (session_->playback) {
            session_->playback->cancel_all();
            session_->playback->close();
        }
        session_->gate->cancel();
        if (collab_.transport) {
            collab_.transport->close();
        }

        if (dispatch_in_flight_) {
            // The late result will be discarded; do not leave the panel loading
            if (collab_.visual) {
                collab_.visual->set_thinking(false);
                collab_.visual->set_view_mode(session_->previous_mode);
            }
            current_mode_ = session_->previous_mode;
            dispatch_in_flight_ = false;
        }
        if (!session_->deferred_turns.empty()) {
            LOG_SESSION("Dropping " + std::to_string(session_->deferred_turns.size()) + " undispatched turn(s)");
            session_->deferred_turns.clear();
        }

        set_state(SessionState::Closed);
        if (on_closed_) {
            on_closed_(reason);
        }
    }

    // =========================================================================
    // Turns
    // =========================================================================

    void on_partial_text(const std::string& text) {
        if (!is_session_active(state_)) {
            return;
        }
        session_->accumulator->append_partial(text);
    }

    void on_turn_boundary() {
        if (!is_session_active(state_)) {
            return;
        }

        std::string text = utils::trim_copy(session_->accumulator->text());
        if (text.empty()) {
            Logger::debug("Turn boundary without text dropped");
            return;
        }

        if (state_ != SessionState::Listening || dispatch_in_flight_) {
            // The service has already started the next turn; freeze this one now
            close_turn();
            session_->deferred_turns.push_back(text);
            LOG_SESSION("Turn deferred until the dispatch in flight resolves: \"" + utils::preview(text) + "\"");
            return;
        }

        if (text == last_dispatched_text()) {
            LOG_SESSION("Duplicate turn boundary dropped: \"" + utils::preview(text) + "\"");
            close_turn();
            return;
        }

        close_turn();
        begin_dispatch(text);
    }

    /// Emit the turn's final entry and open an empty one
    void close_turn() {
        session_->accumulator->finalize();
        session_->accumulator->reset();
    }

    void begin_dispatch(const std::string& text) {
        set_state(SessionState::Sending);
        uint64_t turn_id = ++session_->turn_id;

        dispatch_in_flight_ = true;
        {
            std::lock_guard<std::mutex> lock(session_mutex_);
            last_dispatched_text_ = text;
        }

        session_->previous_mode = current_mode_;
        if (collab_.visual) {
            collab_.visual->set_view_mode(ViewMode::Loading);
            collab_.visual->set_thinking(true);
        }
        current_mode_ = ViewMode::Loading;

        LOG_TRACE(turn_id, "dispatch", "text=\"" + utils::preview(text) + "\"");
        submit_dispatch(text);
        set_state(SessionState::AwaitingBackend);
    }

    void dispatch_deferred_turn() {
        while (!session_->deferred_turns.empty() && !dispatch_in_flight_) {
            std::string text = std::move(session_->deferred_turns.front());
            session_->deferred_turns.pop_front();
            if (text == last_dispatched_text()) {
                LOG_SESSION("Duplicate deferred turn dropped: \"" + utils::preview(text) + "\"");
                continue;
            }
            begin_dispatch(text);
        }
    }

    void submit_dispatch(const std::string& text) {
        std::shared_ptr<SessionEventQueue> queue = queue_;
        std::shared_ptr<IBackendClient> backend = collab_.backend;
        uint64_t gen = session_->generation;
        std::string sid = session_id();

        auto task = [queue, backend, gen, sid, text]() {
            SessionEvent ev;
            ev.type = SessionEvent::Type::DispatchCompleted;
            ev.generation = gen;
            if (backend) {
                ev.dispatch_result = backend->dispatch(sid, text);
            } else {
                ev.dispatch_result = Result<BackendResult>(make_backend_error("no backend configured"));
            }
            queue->post(std::move(ev));
        };

        if (!collab_.executor || !collab_.executor->submit(task)) {
            SessionEvent ev;
            ev.type = SessionEvent::Type::DispatchCompleted;
            ev.generation = gen;
            ev.dispatch_result = Result<BackendResult>(make_backend_error("dispatch executor unavailable"));
            queue_->post(std::move(ev));
        }
    }

    void on_dispatch_completed(const SessionEvent& ev) {
        if (state_ != SessionState::AwaitingBackend || !dispatch_in_flight_ || !ev.dispatch_result) {
            Logger::debug("Dispatch result discarded in state " + std::string(session_state_name(state_)));
            return;
        }
        set_state(SessionState::ApplyingResult);
        if (collab_.visual) {
            collab_.visual->set_thinking(false);
        }

        const auto& result = *ev.dispatch_result;
        std::string reply;
        if (result.is_ok()) {
            const BackendResult& br = result.value();
            auto update = visual_update_for(br);
            if (update) {
                if (collab_.visual) {
                    collab_.visual->set_visual_data(update->payload);
                    collab_.visual->set_view_mode(update->mode);
                }
                current_mode_ = update->mode;
            } else {
                restore_previous_mode();
            }
            reply = br.reply;
            LOG_TRACE(session_->turn_id, "result", "intent=" + br.intent);
        } else {
            Logger::warn("Backend dispatch failed: " + result.error().message);
            restore_previous_mode();
            reply = config_.session.apology_text;
            LOG_TRACE(session_->turn_id, "result", std::string("error=") + error_type_name(result.error().type));
        }

        if (!utils::is_empty_or_whitespace(reply)) {
            if (collab_.transcript) {
                collab_.transcript->append_or_update(Speaker::Ai, reply, true);
            }
            session_->gate->speak(reply);
        }

        dispatch_in_flight_ = false;
        set_state(SessionState::Listening);

        dispatch_deferred_turn();
    }

    void restore_previous_mode() {
        if (collab_.visual) {
            collab_.visual->set_view_mode(session_->previous_mode);
        }
        current_mode_ = session_->previous_mode;
    }

    // =========================================================================
    // Audio
    // =========================================================================

    void on_audio_chunk(const EncodedChunk& chunk) {
        if (!is_session_active(state_)) {
            return;
        }
        // Frames queued before a SpeechStarted event was applied are dropped here
        if (!session_->capture->is_armed()) {
            return;
        }
        auto sent = collab_.transport->send_audio(chunk);
        if (sent.is_error()) {
            Logger::debug("Audio chunk not sent: " + sent.error().message);
        }
    }

    void on_service_audio(const AudioBuffer& samples) {
        if (!is_session_active(state_) || !session_->playback) {
            return;
        }
        session_->playback->enqueue(samples);
    }

    // =========================================================================
    // Member Variables
    // =========================================================================

    Config config_;
    SessionCollaborators collab_;
    ClosedCallback on_closed_;
    std::shared_ptr<SessionEventQueue> queue_;

    std::atomic<SessionState> state_;
    std::atomic<bool> start_pending_;
    std::atomic<bool> speech_muted_;
    uint64_t generation_ = 0;
    std::unique_ptr<Session> session_;
    ViewMode current_mode_ = ViewMode::Search;

    // Session-scoped dispatch guard; read from other threads
    std::atomic<bool> dispatch_in_flight_;
    mutable std::mutex session_mutex_;
    std::string session_id_;
    std::string last_dispatched_text_;
};

// =============================================================================
// Public Interface Implementation
// =============================================================================

SessionOrchestrator::SessionOrchestrator(const Config& config,
                                         SessionCollaborators collaborators,
                                         ClosedCallback on_closed)
    : pimpl_(std::make_unique<Impl>(config, std::move(collaborators), std::move(on_closed))) {}

SessionOrchestrator::~SessionOrchestrator() = default;

Result<void> SessionOrchestrator::start() {
    return pimpl_->start();
}

void SessionOrchestrator::stop(const std::string& reason) {
    pimpl_->stop(reason);
}

void SessionOrchestrator::mute_speech() {
    pimpl_->set_speech_muted(true);
}

void SessionOrchestrator::unmute_speech() {
    pimpl_->set_speech_muted(false);
}

bool SessionOrchestrator::toggle_speech_mute() {
    return pimpl_->toggle_speech_mute();
}

bool SessionOrchestrator::is_speech_muted() const {
    return pimpl_->is_speech_muted();
}

size_t SessionOrchestrator::process_pending() {
    return pimpl_->process_pending();
}

bool SessionOrchestrator::process_next(std::chrono::milliseconds timeout) {
    return pimpl_->process_next(timeout);
}

void SessionOrchestrator::shutdown() {
    pimpl_->shutdown();
}

SessionState SessionOrchestrator::state() const {
    return pimpl_->state();
}

std::string SessionOrchestrator::session_id() const {
    return pimpl_->session_id();
}

bool SessionOrchestrator::is_dispatch_in_flight() const {
    return pimpl_->is_dispatch_in_flight();
}

std::string SessionOrchestrator::last_dispatched_text() const {
    return pimpl_->last_dispatched_text();
}

std::shared_ptr<SessionEventQueue> SessionOrchestrator::event_queue() const {
    return pimpl_->event_queue();
}

} // namespace wayfarer

/**
 * Voice session state machine, driven end to end with scripted collaborators.
 * Asserts:
 * - One turn produces exactly one backend dispatch, after the turn is finalized.
 * - Duplicate and empty boundaries never dispatch; overlapping ones are deferred.
 * - Backend failures are spoken as an apology and the panel is restored.
 * - Capture is off while a reply is spoken, including frames already queued.
 * - Closing is idempotent and late backend results change nothing.
 * - A restart gets a new session id and ignores the old connection.
 *
 * Run from build dir: ./test_session_orchestrator
 */

#include "session_orchestrator.h"
#include "test_fakes.h"
#include <memory>

using namespace wayfarer;
using namespace wayfarer::testing;
using json = nlohmann::json;

namespace {

struct Harness {
    std::shared_ptr<FakeTranscriptionTransport> transport = std::make_shared<FakeTranscriptionTransport>();
    std::shared_ptr<FakeMicrophone> mic = std::make_shared<FakeMicrophone>();
    std::shared_ptr<FakePlaybackDevice> playback = std::make_shared<FakePlaybackDevice>();
    std::shared_ptr<FakeSpeechEngine> speech = std::make_shared<FakeSpeechEngine>();
    std::shared_ptr<FakeBackendClient> backend = std::make_shared<FakeBackendClient>();
    std::shared_ptr<ManualExecutor> executor = std::make_shared<ManualExecutor>();
    std::shared_ptr<RecordingTranscriptSink> transcript = std::make_shared<RecordingTranscriptSink>();
    std::shared_ptr<RecordingVisualSink> visual = std::make_shared<RecordingVisualSink>();
    std::vector<std::string> closed_reasons;
    Config config;
    TranscriptionProtocol protocol;
    std::unique_ptr<SessionOrchestrator> session;

    explicit Harness(bool play_service_audio = false) {
        config.audio.frame_samples = 4;
        config.session.play_service_audio = play_service_audio;
        config.session.apology_text = "Sorry, something went wrong.";

        SessionCollaborators collab;
        collab.transport = transport;
        collab.microphone = mic;
        collab.playback = playback;
        collab.speech = speech;
        collab.backend = backend;
        collab.executor = executor;
        collab.transcript = transcript;
        collab.visual = visual;
        session = std::make_unique<SessionOrchestrator>(config, collab, [this](const std::string& reason) {
            closed_reasons.push_back(reason);
        });
    }

    void pump() { session->process_pending(); }

    void open() {
        session->start();
        pump();
        transport->emit(TranscriptionEvent::opened());
        pump();
    }

    void say(const std::string& text) {
        transport->emit(TranscriptionEvent::partial(text));
        pump();
    }

    void boundary(const std::string& text) {
        transport->emit(TranscriptionEvent::boundary(text));
        pump();
    }

    /// Run a raw service message through the wire protocol, as the socket thread does
    void service_message(const std::string& payload) {
        auto events = protocol.parse(payload);
        if (events.is_ok()) {
            for (const auto& ev : events.value()) {
                transport->emit(ev);
            }
        }
        pump();
    }

    void service_fragment(const std::string& text) {
        service_message(json{{"serverContent", {{"inputTranscription", {{"text", text}}}}}}.dump());
    }

    void service_model_turn() {
        service_message(R"({"serverContent": {"modelTurn": {"parts": []}}})");
    }

    void run_backend() {
        executor->run_all();
        pump();
    }

    std::string last_ai_text() const {
        for (auto it = transcript->calls.rbegin(); it != transcript->calls.rend(); ++it) {
            if (it->speaker == Speaker::Ai) return it->text;
        }
        return "";
    }
};

BackendResult flights_reply() {
    BackendResult r;
    r.reply = "I found 2 flights to San Jose.";
    r.intent = "search_flights";
    r.flights = json::array({json{{"airline", "United"}}, json{{"airline", "Alaska"}}});
    return r;
}

} // namespace

int main() {
    // --- one turn, one dispatch ---
    {
        Harness h;
        h.open();
        ASSERT(h.session->state() == SessionState::Listening);
        ASSERT(h.mic->is_open());
        ASSERT(!h.visual->data.empty() && h.visual->data[0].is_null());
        ASSERT(!h.visual->modes.empty() && h.visual->modes[0] == ViewMode::Search);
        ASSERT(h.session->session_id().rfind("session-", 0) == 0);

        h.say("San");
        h.say("San Jose");
        ASSERT(h.executor->tasks.empty());
        h.boundary("San Jose");
        ASSERT(h.executor->tasks.size() == 1);
        ASSERT(h.session->state() == SessionState::AwaitingBackend);
        ASSERT(h.session->is_dispatch_in_flight());
        ASSERT(h.session->last_dispatched_text() == "San Jose");
        ASSERT(h.visual->last_mode() == ViewMode::Loading);
        ASSERT(h.visual->thinking_calls.size() == 1 && h.visual->thinking_calls[0]);
        // Finalized before dispatch
        ASSERT(h.transcript->final_count(Speaker::User) == 1);

        h.backend->push_reply(flights_reply());
        h.run_backend();
        ASSERT(h.backend->calls.size() == 1);
        ASSERT(h.backend->calls[0].first == h.session->session_id());
        ASSERT(h.backend->calls[0].second == "San Jose");
        ASSERT(h.session->state() == SessionState::Listening);
        ASSERT(!h.session->is_dispatch_in_flight());
        ASSERT(h.visual->last_mode() == ViewMode::Flights);
        ASSERT(h.visual->data.back().size() == 2);
        ASSERT(h.visual->thinking_calls.back() == false);
        ASSERT(h.transcript->final_count(Speaker::Ai) == 1);
        ASSERT(h.last_ai_text() == "I found 2 flights to San Jose.");
        ASSERT(h.speech->spoken.size() == 1);
    }

    // --- backend failure: apology, panel restored, next turn still works ---
    {
        Harness h;
        h.open();
        h.say("Flights to Goa");
        h.boundary("Flights to Goa");
        h.backend->push_failure("connection refused");
        h.run_backend();
        ASSERT(h.last_ai_text() == "Sorry, something went wrong.");
        ASSERT(h.speech->spoken.size() == 1 && h.speech->spoken[0] == "Sorry, something went wrong.");
        ASSERT(h.visual->last_mode() == ViewMode::Search);
        ASSERT(h.session->state() == SessionState::Listening);

        h.say("Hotels in Goa");
        h.boundary("Hotels in Goa");
        h.run_backend();
        ASSERT(h.backend->calls.size() == 2);
        ASSERT(h.backend->calls[1].second == "Hotels in Goa");
    }

    // --- no visual data keeps the previous panel ---
    {
        Harness h;
        h.open();
        h.say("Flights to San Jose");
        h.boundary("Flights to San Jose");
        h.backend->push_reply(flights_reply());
        h.run_backend();
        h.say("Thanks");
        h.boundary("Thanks");
        h.run_backend();
        ASSERT(h.visual->last_mode() == ViewMode::Flights);
    }

    // --- duplicate and empty boundaries ---
    {
        Harness h;
        h.open();
        h.boundary("");
        ASSERT(h.executor->tasks.empty());

        h.say("San Jose");
        h.boundary("San Jose");
        h.boundary("San Jose");
        h.run_backend();
        ASSERT(h.backend->calls.size() == 1);

        // Same text again after completion
        h.boundary("San Jose");
        h.say("San Jose");
        h.boundary("San Jose");
        h.run_backend();
        ASSERT(h.backend->calls.size() == 1);
        ASSERT(h.executor->max_outstanding == 1);

        // The repeated words are closed out, not left as a pending entry
        ASSERT(h.transcript->calls.back().speaker == Speaker::User);
        ASSERT(h.transcript->calls.back().text == "San Jose");
        ASSERT(h.transcript->calls.back().is_final);
        size_t before_close = h.transcript->calls.size();
        h.session->stop();
        h.pump();
        ASSERT(h.transcript->calls.size() == before_close);
    }

    // --- speech that continues after a deferred boundary is its own turn ---
    {
        Harness h;
        h.open();
        h.service_fragment("Flights to Goa");
        h.service_model_turn();
        ASSERT(h.executor->tasks.size() == 1);

        // Next utterance ends while the first is still with the backend
        h.service_fragment("Hotels");
        h.service_model_turn();
        h.service_fragment(" in Goa");
        ASSERT(h.executor->tasks.size() == 1);

        bool hotels_final = false;
        for (const auto& c : h.transcript->calls) {
            if (c.speaker == Speaker::User && c.text == "Hotels" && c.is_final) hotels_final = true;
        }
        ASSERT(hotels_final);

        h.run_backend();
        ASSERT(h.backend->calls.size() == 1);
        ASSERT(h.executor->tasks.size() == 1);
        h.run_backend();
        ASSERT(h.backend->calls.size() == 2);
        ASSERT(h.backend->calls[1].second == "Hotels");

        h.service_model_turn();
        h.run_backend();
        ASSERT(h.backend->calls.size() == 3);
        ASSERT(h.backend->calls[2].second == "in Goa");
        ASSERT(h.executor->max_outstanding <= 1);
        ASSERT(h.session->state() == SessionState::Listening);
    }

    // --- deferred turns are dropped on close ---
    {
        Harness h;
        h.open();
        h.say("Flights to Goa");
        h.boundary("Flights to Goa");
        h.say("Hotels in Goa");
        h.boundary("Hotels in Goa");
        h.session->stop();
        h.pump();
        h.run_backend();
        ASSERT(h.backend->calls.size() == 1);
        ASSERT(h.executor->tasks.empty());
        ASSERT(h.closed_reasons.size() == 1);
    }

    // --- boundary during a dispatch is deferred, then dispatched ---
    {
        Harness h;
        h.open();
        h.say("Flights to Goa");
        h.boundary("Flights to Goa");
        h.say("Hotels in Goa");
        h.boundary("Hotels in Goa");
        ASSERT(h.executor->tasks.size() == 1);
        ASSERT(h.session->state() == SessionState::AwaitingBackend);

        h.run_backend();
        ASSERT(h.backend->calls.size() == 1);
        ASSERT(h.executor->tasks.size() == 1);
        ASSERT(h.session->state() == SessionState::AwaitingBackend);

        h.run_backend();
        ASSERT(h.backend->calls.size() == 2);
        ASSERT(h.backend->calls[0].second == "Flights to Goa");
        ASSERT(h.backend->calls[1].second == "Hotels in Goa");
        ASSERT(h.executor->max_outstanding <= 1);
        ASSERT(h.session->state() == SessionState::Listening);
    }

    // --- capture is off while a reply is spoken ---
    {
        Harness h;
        h.open();
        h.mic->feed_constant(4, 0.1f);
        h.pump();
        ASSERT(h.transport->sent.size() == 1);

        h.say("Flights to Goa");
        h.boundary("Flights to Goa");
        h.run_backend();
        ASSERT(h.speech->spoken.size() == 1);

        // A frame captured before speech began is still sent; one queued after is not
        h.mic->feed_constant(4, 0.1f);
        h.speech->start();
        h.mic->feed_constant(4, 0.1f);
        h.pump();
        ASSERT(h.transport->sent.size() == 2);

        h.mic->feed_constant(8, 0.1f);
        h.pump();
        ASSERT(h.transport->sent.size() == 2);

        h.speech->finish();
        h.pump();
        h.mic->feed_constant(4, 0.1f);
        h.pump();
        ASSERT(h.transport->sent.size() == 3);
    }

    // --- a speech error resumes capture ---
    {
        Harness h;
        h.open();
        h.say("Hotels in Goa");
        h.boundary("Hotels in Goa");
        h.run_backend();
        h.speech->start();
        h.pump();
        h.mic->feed_constant(4, 0.1f);
        h.pump();
        ASSERT(h.transport->sent.empty());

        h.speech->fail("audio device lost");
        h.pump();
        h.mic->feed_constant(4, 0.1f);
        h.pump();
        ASSERT(h.transport->sent.size() == 1);
        ASSERT(h.session->state() == SessionState::Listening);
    }

    // --- muted replies are shown but not spoken ---
    {
        Harness h;
        h.open();
        h.session->mute_speech();
        h.pump();
        ASSERT(h.session->is_speech_muted());
        h.say("Flights to Goa");
        h.boundary("Flights to Goa");
        h.run_backend();
        ASSERT(h.speech->spoken.empty());
        ASSERT(h.transcript->final_count(Speaker::Ai) == 1);

        ASSERT(h.session->toggle_speech_mute() == false);
        h.pump();
        h.say("Hotels in Goa");
        h.boundary("Hotels in Goa");
        h.run_backend();
        ASSERT(h.speech->spoken.size() == 1);
    }

    // --- close is idempotent; a late result changes nothing ---
    {
        Harness h;
        h.open();
        h.say("Flights to Goa");
        h.boundary("Flights to Goa");
        h.session->stop();
        h.session->stop();
        h.pump();
        ASSERT(h.closed_reasons.size() == 1);
        ASSERT(h.closed_reasons[0] == "stopped by user");
        ASSERT(h.session->state() == SessionState::Closed);
        ASSERT(h.mic->close_calls == 1);
        ASSERT(h.transport->close_calls == 1);
        ASSERT(!h.session->is_dispatch_in_flight());
        ASSERT(h.visual->thinking_calls.back() == false);
        ASSERT(h.visual->last_mode() == ViewMode::Search);

        size_t visual_calls = h.visual->call_count();
        h.backend->push_reply(flights_reply());
        h.run_backend();
        ASSERT(h.transcript->final_count(Speaker::Ai) == 0);
        ASSERT(h.speech->spoken.empty());
        ASSERT(h.visual->call_count() == visual_calls);
        ASSERT(h.closed_reasons.size() == 1);
    }

    // --- transport close flushes the unfinished turn ---
    {
        Harness h;
        h.open();
        h.say("Book the Taj");
        h.transport->emit(TranscriptionEvent::closed(1006, "abnormal closure"));
        h.pump();
        ASSERT(h.closed_reasons.size() == 1);
        ASSERT(h.closed_reasons[0] == "transcription transport closed (code 1006): abnormal closure");
        ASSERT(h.transcript->final_count(Speaker::User) == 1);
        ASSERT(h.transcript->calls.back().text == "Book the Taj");
        ASSERT(h.executor->tasks.empty());
    }

    // --- transport errors ---
    {
        Harness h;
        h.open();
        h.transport->emit(TranscriptionEvent::error("tls handshake failed"));
        h.pump();
        ASSERT(h.closed_reasons.size() == 1);
        ASSERT(h.closed_reasons[0] == "transcription transport error: tls handshake failed");
    }
    {
        Harness h;
        h.transport->fail_connect = true;
        h.session->start();
        h.pump();
        ASSERT(h.session->state() == SessionState::Closed);
        ASSERT(h.closed_reasons.size() == 1);
        ASSERT(h.closed_reasons[0] == "transcription transport error: dns failure");
        ASSERT(h.mic->close_calls == 1);
    }

    // --- microphone failure ---
    {
        Harness h;
        h.mic->fail_open = true;
        h.session->start();
        h.pump();
        ASSERT(h.session->state() == SessionState::Closed);
        ASSERT(h.closed_reasons.size() == 1);
        ASSERT(h.closed_reasons[0].rfind("microphone unavailable", 0) == 0);
        ASSERT(h.transport->connect_calls == 0);
    }

    // --- restart: new session id, old connection ignored ---
    {
        Harness h;
        h.open();
        ASSERT(h.session->start().is_error());
        std::string first_id = h.session->session_id();
        h.say("Flights to Goa");
        h.boundary("Flights to Goa");
        h.run_backend();
        h.session->stop();
        h.pump();

        ASSERT(h.session->start().is_ok());
        h.pump();
        ASSERT(h.session->session_id() != first_id);
        ASSERT(h.session->last_dispatched_text().empty());
        ASSERT(h.transport->handlers.size() == 2);

        size_t before = h.transcript->calls.size();
        h.transport->handlers[0](TranscriptionEvent::partial("ghost text"));
        h.pump();
        ASSERT(h.transcript->calls.size() == before);

        h.transport->emit(TranscriptionEvent::opened());
        h.pump();
        ASSERT(h.session->state() == SessionState::Listening);

        // The same words are a new turn in a new session
        h.say("Flights to Goa");
        h.boundary("Flights to Goa");
        h.run_backend();
        ASSERT(h.backend->calls.size() == 2);
        ASSERT(h.backend->calls[1].first == h.session->session_id());
    }

    // --- service audio playback and barge-in ---
    {
        Harness h(true);
        h.open();
        ASSERT(h.playback->started);
        h.transport->emit(TranscriptionEvent::service_audio(AudioBuffer(2400, 5)));
        h.transport->emit(TranscriptionEvent::service_audio(AudioBuffer(2400, 5)));
        h.pump();
        ASSERT(h.playback->scheduled.size() == 2);
        h.transport->emit(TranscriptionEvent::interrupted());
        h.pump();
        ASSERT(h.playback->stopped.size() == 2);

        h.session->stop();
        h.pump();
        ASSERT(h.playback->close_calls == 1);
    }

    // --- service audio is ignored unless enabled ---
    {
        Harness h;
        h.open();
        h.transport->emit(TranscriptionEvent::service_audio(AudioBuffer(2400, 5)));
        h.pump();
        ASSERT(h.playback->scheduled.empty());
    }

    // --- shutdown ---
    {
        Harness h;
        h.open();
        h.session->shutdown();
        ASSERT(h.closed_reasons.size() == 1 && h.closed_reasons[0] == "shutting down");
        ASSERT(h.session->start().is_error());
        h.session->shutdown();
        ASSERT(h.closed_reasons.size() == 1);
    }

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All session orchestrator tests passed.\n";
    return 0;
}

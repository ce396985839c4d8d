/**
 * Streaming transcription wire protocol.
 * Asserts:
 * - Setup and audio messages have the shape the service expects.
 * - Input transcription fragments accumulate into cumulative partials.
 * - The first model turn after user speech is the turn boundary and resets the buffer.
 * - Inline PCM16 audio is decoded into samples.
 *
 * Run from build dir: ./test_transcription_protocol
 */

#include "transcription_link.h"
#include "test_fakes.h"
#include <nlohmann/json.hpp>

using namespace wayfarer;
using json = nlohmann::json;

static std::string fragment(const std::string& text) {
    return json{{"serverContent", {{"inputTranscription", {{"text", text}}}}}}.dump();
}

static std::string model_turn(const std::string& b64_audio = "") {
    json parts = json::array();
    if (!b64_audio.empty()) {
        parts.push_back({{"inlineData", {{"mimeType", "audio/pcm;rate=24000"}, {"data", b64_audio}}}});
    }
    return json{{"serverContent", {{"modelTurn", {{"parts", parts}}}}}}.dump();
}

int main() {
    // --- setup message ---
    {
        TranscriptionConfig cfg;
        cfg.model = "models/test-model";
        cfg.voice_name = "Kore";
        cfg.system_instruction = "Transcribe only.";
        json setup = json::parse(TranscriptionProtocol::build_setup_message(cfg));
        ASSERT(setup.contains("setup"));
        const auto& s = setup["setup"];
        ASSERT(s["model"] == "models/test-model");
        ASSERT(s["generationConfig"]["responseModalities"] == json::array({"AUDIO"}));
        ASSERT(s["generationConfig"]["speechConfig"]["voiceConfig"]["prebuiltVoiceConfig"]["voiceName"] == "Kore");
        ASSERT(s["systemInstruction"]["parts"][0]["text"] == "Transcribe only.");
        ASSERT(s["inputAudioTranscription"].is_object());
    }

    // --- audio message ---
    {
        EncodedChunk chunk;
        chunk.mime_type = "audio/pcm;rate=16000";
        chunk.data = "AAD/fwGA";
        chunk.sample_count = 3;
        json msg = json::parse(TranscriptionProtocol::build_audio_message(chunk));
        const auto& media = msg["realtimeInput"]["mediaChunks"];
        ASSERT(media.is_array() && media.size() == 1);
        ASSERT(media[0]["mimeType"] == "audio/pcm;rate=16000");
        ASSERT(media[0]["data"] == "AAD/fwGA");
    }

    // --- setupComplete opens the stream ---
    {
        TranscriptionProtocol protocol;
        auto r = protocol.parse(R"({"setupComplete": {}})");
        ASSERT(r.is_ok());
        ASSERT(r.value().size() == 1);
        ASSERT(r.value()[0].type == TranscriptionEvent::Type::Opened);
    }

    // --- cumulative partials then boundary ---
    {
        TranscriptionProtocol protocol;
        auto a = protocol.parse(fragment("San"));
        auto b = protocol.parse(fragment(" Jose"));
        ASSERT(a.is_ok() && b.is_ok());
        ASSERT(a.value().size() == 1 && a.value()[0].type == TranscriptionEvent::Type::PartialText);
        ASSERT(a.value()[0].text == "San");
        ASSERT(b.value()[0].text == "San Jose");
        ASSERT(protocol.turn_text() == "San Jose");

        auto turn = protocol.parse(model_turn());
        ASSERT(turn.is_ok());
        ASSERT(turn.value().size() == 1);
        ASSERT(turn.value()[0].type == TranscriptionEvent::Type::TurnBoundary);
        ASSERT(turn.value()[0].text == "San Jose");
        ASSERT(protocol.turn_text().empty());

        // Further model output in the same response is not another boundary
        auto more = protocol.parse(model_turn());
        ASSERT(more.is_ok() && more.value().empty());

        // Next turn starts fresh
        auto next = protocol.parse(fragment("Mumbai"));
        ASSERT(next.value()[0].text == "Mumbai");
    }

    // --- empty fragments are ignored ---
    {
        TranscriptionProtocol protocol;
        auto r = protocol.parse(fragment(""));
        ASSERT(r.is_ok() && r.value().empty());
    }

    // --- service audio and ordering within one message ---
    {
        TranscriptionProtocol protocol;
        protocol.parse(fragment("hello"));
        auto r = protocol.parse(model_turn("AAD/fwGA"));
        ASSERT(r.is_ok());
        ASSERT(r.value().size() == 2);
        ASSERT(r.value()[0].type == TranscriptionEvent::Type::TurnBoundary);
        ASSERT(r.value()[1].type == TranscriptionEvent::Type::ServiceAudio);
        const auto& audio = r.value()[1].audio;
        ASSERT(audio.size() == 3);
        ASSERT(audio[0] == 0);
        ASSERT(audio[1] == 32767);
        ASSERT(audio[2] == -32767);
    }

    // --- non-audio inline data is skipped ---
    {
        TranscriptionProtocol protocol;
        std::string msg = json{{"serverContent", {{"modelTurn", {{"parts", json::array({
            {{"inlineData", {{"mimeType", "image/png"}, {"data", "AAAA"}}}},
            {{"text", "hi"}}
        })}}}}}}.dump();
        auto r = protocol.parse(msg);
        ASSERT(r.is_ok() && r.value().empty());
    }

    // --- interrupted ---
    {
        TranscriptionProtocol protocol;
        auto r = protocol.parse(R"({"serverContent": {"interrupted": true}})");
        ASSERT(r.is_ok() && r.value().size() == 1);
        ASSERT(r.value()[0].type == TranscriptionEvent::Type::Interrupted);
    }

    // --- reset drops the pending turn ---
    {
        TranscriptionProtocol protocol;
        protocol.parse(fragment("half a sentence"));
        protocol.reset();
        auto r = protocol.parse(model_turn());
        ASSERT(r.is_ok() && r.value().empty());
    }

    // --- malformed and unknown messages ---
    {
        TranscriptionProtocol protocol;
        auto bad = protocol.parse("{not json");
        ASSERT(bad.is_error());
        ASSERT(bad.error().type == ErrorType::ParseError);
        ASSERT(protocol.parse("42").is_error());
        auto unknown = protocol.parse(R"({"usageMetadata": {"totalTokenCount": 12}})");
        ASSERT(unknown.is_ok() && unknown.value().empty());
    }

    // --- event factories ---
    {
        auto closed = TranscriptionEvent::closed(1011, "internal error");
        ASSERT(closed.type == TranscriptionEvent::Type::Closed);
        ASSERT(closed.code == 1011 && closed.text == "internal error");
        ASSERT(std::string(transcription_event_name(TranscriptionEvent::Type::TurnBoundary)) == "TurnBoundary");
    }

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All transcription protocol tests passed.\n";
    return 0;
}

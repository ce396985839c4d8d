#pragma once

#include "common.h"
#include "config.h"
#include "errors.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace wayfarer {

/**
 * @brief Inbound event from the streaming transcription service
 */
struct TranscriptionEvent {
    enum class Type {
        Opened,        ///< Service ready to receive audio
        PartialText,   ///< Cumulative user transcript for the current turn
        TurnBoundary,  ///< The service decided the user stopped speaking
        ServiceAudio,  ///< Decoded PCM16 voice output from the service
        Interrupted,   ///< Barge-in: the service detected the user talking over it
        Closed,        ///< Socket closed (code, reason)
        Error          ///< Socket failure (message)
    };

    Type type = Type::Error;
    std::string text;   ///< PartialText/TurnBoundary text, Closed reason or Error message
    AudioBuffer audio;  ///< ServiceAudio samples
    int code = 0;       ///< Closed code

    static TranscriptionEvent opened();
    static TranscriptionEvent partial(const std::string& text);
    static TranscriptionEvent boundary(const std::string& text);
    static TranscriptionEvent service_audio(AudioBuffer samples);
    static TranscriptionEvent interrupted();
    static TranscriptionEvent closed(int code, const std::string& reason);
    static TranscriptionEvent error(const std::string& message);
};

const char* transcription_event_name(TranscriptionEvent::Type type);

using TranscriptionHandler = std::function<void(const TranscriptionEvent&)>;

/**
 * @brief Bidirectional transcription stream
 *
 * The handler may be called from a transport-owned thread. No events are
 * delivered after close() returns.
 */
class ITranscriptionTransport {
public:
    virtual ~ITranscriptionTransport() = default;

    /**
     * @brief Open the stream; Opened (or Error/Closed) follows asynchronously
     * @return TransportError if the connection cannot be initiated
     */
    virtual Result<void> connect(TranscriptionHandler handler) = 0;

    virtual Result<void> send_audio(const EncodedChunk& chunk) = 0;

    /// Close the stream. Idempotent.
    virtual void close() = 0;
};

/**
 * @brief Streaming speech service wire protocol
 *
 * Builds outbound messages and turns inbound JSON into events. Input
 * transcription arrives as fragments; they are concatenated per turn and
 * surfaced as cumulative text. The first model turn after user speech marks
 * the user's turn boundary and resets the buffer.
 */
class TranscriptionProtocol {
public:
    static std::string build_setup_message(const TranscriptionConfig& config);
    static std::string build_audio_message(const EncodedChunk& chunk);

    /**
     * @brief Parse one inbound message
     * @return Events in arrival order, or ParseError for a malformed message
     */
    Result<std::vector<TranscriptionEvent>> parse(const std::string& payload);

    const std::string& turn_text() const { return turn_text_; }
    void reset() { turn_text_.clear(); }

private:
    std::string turn_text_;
};

/**
 * @brief Transcription over the Gemini Live websocket (websocketpp, TLS)
 */
class GeminiLiveTranscriptionLink : public ITranscriptionTransport {
public:
    explicit GeminiLiveTranscriptionLink(const TranscriptionConfig& config);
    ~GeminiLiveTranscriptionLink() override;

    GeminiLiveTranscriptionLink(const GeminiLiveTranscriptionLink&) = delete;
    GeminiLiveTranscriptionLink& operator=(const GeminiLiveTranscriptionLink&) = delete;

    Result<void> connect(TranscriptionHandler handler) override;
    Result<void> send_audio(const EncodedChunk& chunk) override;
    void close() override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace wayfarer

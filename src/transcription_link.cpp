#include "transcription_link.h"
#include "logger.h"
#include <websocketpp/base64/base64.hpp>
#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_client.hpp>
#include <boost/asio/ssl.hpp>
#include <nlohmann/json.hpp>
#include <mutex>
#include <thread>

using json = nlohmann::json;

namespace wayfarer {

// =============================================================================
// Events
// =============================================================================

TranscriptionEvent TranscriptionEvent::opened() {
    TranscriptionEvent ev;
    ev.type = Type::Opened;
    return ev;
}

TranscriptionEvent TranscriptionEvent::partial(const std::string& text) {
    TranscriptionEvent ev;
    ev.type = Type::PartialText;
    ev.text = text;
    return ev;
}

TranscriptionEvent TranscriptionEvent::boundary(const std::string& text) {
    TranscriptionEvent ev;
    ev.type = Type::TurnBoundary;
    ev.text = text;
    return ev;
}

TranscriptionEvent TranscriptionEvent::service_audio(AudioBuffer samples) {
    TranscriptionEvent ev;
    ev.type = Type::ServiceAudio;
    ev.audio = std::move(samples);
    return ev;
}

TranscriptionEvent TranscriptionEvent::interrupted() {
    TranscriptionEvent ev;
    ev.type = Type::Interrupted;
    return ev;
}

TranscriptionEvent TranscriptionEvent::closed(int code, const std::string& reason) {
    TranscriptionEvent ev;
    ev.type = Type::Closed;
    ev.code = code;
    ev.text = reason;
    return ev;
}

TranscriptionEvent TranscriptionEvent::error(const std::string& message) {
    TranscriptionEvent ev;
    ev.type = Type::Error;
    ev.text = message;
    return ev;
}

const char* transcription_event_name(TranscriptionEvent::Type type) {
    switch (type) {
        case TranscriptionEvent::Type::Opened: return "Opened";
        case TranscriptionEvent::Type::PartialText: return "PartialText";
        case TranscriptionEvent::Type::TurnBoundary: return "TurnBoundary";
        case TranscriptionEvent::Type::ServiceAudio: return "ServiceAudio";
        case TranscriptionEvent::Type::Interrupted: return "Interrupted";
        case TranscriptionEvent::Type::Closed: return "Closed";
        case TranscriptionEvent::Type::Error: return "Error";
    }
    return "Unknown";
}

// =============================================================================
// Protocol
// =============================================================================

std::string TranscriptionProtocol::build_setup_message(const TranscriptionConfig& config) {
    json setup = {
        {"setup", {
            {"model", config.model},
            {"generationConfig", {
                {"responseModalities", json::array({"AUDIO"})},
                {"speechConfig", {
                    {"voiceConfig", {
                        {"prebuiltVoiceConfig", {{"voiceName", config.voice_name}}}
                    }}
                }}
            }},
            {"systemInstruction", {
                {"parts", json::array({{{"text", config.system_instruction}}})}
            }},
            {"inputAudioTranscription", json::object()}
        }}
    };
    return setup.dump();
}

std::string TranscriptionProtocol::build_audio_message(const EncodedChunk& chunk) {
    json msg = {
        {"realtimeInput", {
            {"mediaChunks", json::array({
                {{"mimeType", chunk.mime_type}, {"data", chunk.data}}
            })}
        }}
    };
    return msg.dump();
}

namespace {

AudioBuffer decode_pcm16_base64(const std::string& b64) {
    std::string raw = websocketpp::base64_decode(b64);
    AudioBuffer samples;
    samples.reserve(raw.size() / 2);
    for (size_t i = 0; i + 1 < raw.size(); i += 2) {
        uint16_t u = static_cast<uint8_t>(raw[i]) | (static_cast<uint8_t>(raw[i + 1]) << 8);
        samples.push_back(static_cast<Sample>(u));
    }
    return samples;
}

} // namespace

Result<std::vector<TranscriptionEvent>> TranscriptionProtocol::parse(const std::string& payload) {
    json j;
    try {
        j = json::parse(payload);
    } catch (const json::exception& e) {
        return make_parse_error("Transcription message parse error: " + std::string(e.what()));
    }
    if (!j.is_object()) {
        return make_parse_error("Transcription message is not a JSON object");
    }

    std::vector<TranscriptionEvent> events;

    if (j.contains("setupComplete")) {
        events.push_back(TranscriptionEvent::opened());
    }

    if (j.contains("serverContent") && j["serverContent"].is_object()) {
        const auto& sc = j["serverContent"];

        if (sc.contains("inputTranscription") && sc["inputTranscription"].is_object()) {
            const auto& it = sc["inputTranscription"];
            if (it.contains("text") && it["text"].is_string()) {
                std::string fragment = it["text"].get<std::string>();
                if (!fragment.empty()) {
                    turn_text_ += fragment;
                    events.push_back(TranscriptionEvent::partial(turn_text_));
                }
            }
        }

        if (sc.contains("interrupted") && sc["interrupted"].is_boolean() && sc["interrupted"].get<bool>()) {
            events.push_back(TranscriptionEvent::interrupted());
        }

        if (sc.contains("modelTurn") && sc["modelTurn"].is_object()) {
            if (!turn_text_.empty()) {
                events.push_back(TranscriptionEvent::boundary(turn_text_));
                turn_text_.clear();
            }

            const auto& turn = sc["modelTurn"];
            if (turn.contains("parts") && turn["parts"].is_array()) {
                for (const auto& part : turn["parts"]) {
                    if (!part.contains("inlineData") || !part["inlineData"].is_object()) continue;
                    const auto& inline_data = part["inlineData"];
                    std::string mime = inline_data.value("mimeType", "");
                    if (mime.rfind("audio/pcm", 0) != 0) continue;
                    if (!inline_data.contains("data") || !inline_data["data"].is_string()) continue;
                    AudioBuffer samples = decode_pcm16_base64(inline_data["data"].get<std::string>());
                    if (!samples.empty()) {
                        events.push_back(TranscriptionEvent::service_audio(std::move(samples)));
                    }
                }
            }
        }
    }

    if (j.contains("goAway")) {
        LOG_STT("Service sent goAway: " + j["goAway"].dump());
    }

    return events;
}

// =============================================================================
// GeminiLiveTranscriptionLink
// =============================================================================

class GeminiLiveTranscriptionLink::Impl {
public:
    using Client = websocketpp::client<websocketpp::config::asio_tls_client>;
    using MessagePtr = websocketpp::config::asio_tls_client::message_type::ptr;
    using ContextPtr = std::shared_ptr<boost::asio::ssl::context>;

    explicit Impl(const TranscriptionConfig& config) : config_(config) {}

    ~Impl() {
        close();
    }

    Result<void> connect(TranscriptionHandler handler) {
        close();

        std::string api_key = config_.resolved_api_key();
        if (api_key.empty()) {
            return make_transport_error("No API key for transcription service (set " + config_.api_key_env + ")");
        }

        {
            std::lock_guard<std::mutex> lock(handler_mutex_);
            handler_ = std::move(handler);
        }
        protocol_.reset();

        client_ = std::make_unique<Client>();
        try {
            client_->clear_access_channels(websocketpp::log::alevel::all);
            client_->clear_error_channels(websocketpp::log::elevel::all);
            client_->init_asio();

            client_->set_tls_init_handler([this](websocketpp::connection_hdl) {
                return make_tls_context();
            });
            client_->set_open_handler([this](websocketpp::connection_hdl hdl) {
                on_open(hdl);
            });
            client_->set_message_handler([this](websocketpp::connection_hdl, MessagePtr msg) {
                on_message(msg->get_payload());
            });
            client_->set_fail_handler([this](websocketpp::connection_hdl hdl) {
                std::string reason;
                websocketpp::lib::error_code ec;
                auto con = client_->get_con_from_hdl(hdl, ec);
                reason = con ? con->get_ec().message() : ec.message();
                emit(TranscriptionEvent::error(reason));
            });
            client_->set_close_handler([this](websocketpp::connection_hdl hdl) {
                websocketpp::lib::error_code ec;
                auto con = client_->get_con_from_hdl(hdl, ec);
                int code = con ? static_cast<int>(con->get_remote_close_code()) : 0;
                std::string reason = con ? con->get_remote_close_reason() : ec.message();
                emit(TranscriptionEvent::closed(code, reason));
            });

            std::string uri = config_.endpoint + "?key=" + api_key;
            websocketpp::lib::error_code ec;
            auto con = client_->get_connection(uri, ec);
            if (ec) {
                client_.reset();
                return make_transport_error("Transcription connection error: " + ec.message());
            }
            client_->connect(con);
        } catch (const websocketpp::exception& e) {
            client_.reset();
            return make_transport_error(std::string("Transcription connect failed: ") + e.what());
        }

        LOG_STT("Connecting to " + config_.endpoint);
        ws_thread_ = std::thread([this]() { run_client(); });
        return Result<void>();
    }

    Result<void> send_audio(const EncodedChunk& chunk) {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        if (!client_ || conn_.expired()) {
            return make_transport_error("Transcription stream not open");
        }
        websocketpp::lib::error_code ec;
        client_->send(conn_, TranscriptionProtocol::build_audio_message(chunk),
                      websocketpp::frame::opcode::text, ec);
        if (ec) {
            return make_transport_error("Audio send failed: " + ec.message());
        }
        return Result<void>();
    }

    void close() {
        if (!client_) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(conn_mutex_);
            if (!conn_.expired()) {
                websocketpp::lib::error_code ec;
                client_->close(conn_, websocketpp::close::status::normal, "session closed", ec);
                if (ec) {
                    LOG_STT("Close handshake failed: " + ec.message());
                    client_->stop();
                }
            } else {
                client_->stop();
            }
            conn_.reset();
        }
        if (ws_thread_.joinable()) {
            ws_thread_.join();
        }
        {
            std::lock_guard<std::mutex> lock(handler_mutex_);
            handler_ = nullptr;
        }
        client_.reset();
        LOG_STT("Transcription stream closed");
    }

private:
    void run_client() {
        try {
            client_->run();
        } catch (const std::exception& e) {
            emit(TranscriptionEvent::error(std::string("Transcription socket failure: ") + e.what()));
        }
    }

    ContextPtr make_tls_context() {
        auto ctx = std::make_shared<boost::asio::ssl::context>(boost::asio::ssl::context::tlsv12_client);
        try {
            ctx->set_options(boost::asio::ssl::context::default_workarounds |
                             boost::asio::ssl::context::no_sslv2 |
                             boost::asio::ssl::context::no_sslv3 |
                             boost::asio::ssl::context::single_dh_use);
            if (config_.verify_tls) {
                ctx->set_default_verify_paths();
                ctx->set_verify_mode(boost::asio::ssl::verify_peer);
            } else {
                ctx->set_verify_mode(boost::asio::ssl::verify_none);
            }
        } catch (const std::exception& e) {
            Logger::error(std::string("TLS context setup failed: ") + e.what());
        }
        return ctx;
    }

    void on_open(websocketpp::connection_hdl hdl) {
        {
            std::lock_guard<std::mutex> lock(conn_mutex_);
            conn_ = hdl;
        }
        websocketpp::lib::error_code ec;
        client_->send(hdl, TranscriptionProtocol::build_setup_message(config_),
                      websocketpp::frame::opcode::text, ec);
        if (ec) {
            emit(TranscriptionEvent::error("Failed to send setup: " + ec.message()));
            return;
        }
        LOG_STT("Socket open, setup sent (model=" + config_.model + ")");
    }

    void on_message(const std::string& payload) {
        auto parsed = protocol_.parse(payload);
        if (parsed.is_error()) {
            Logger::warn(parsed.error().message);
            return;
        }
        for (const auto& ev : parsed.value()) {
            emit(ev);
        }
    }

    void emit(const TranscriptionEvent& ev) {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        if (handler_) {
            handler_(ev);
        }
    }

    TranscriptionConfig config_;
    TranscriptionProtocol protocol_;

    std::unique_ptr<Client> client_;
    std::thread ws_thread_;
    std::mutex conn_mutex_;
    websocketpp::connection_hdl conn_;

    std::mutex handler_mutex_;
    TranscriptionHandler handler_;
};

GeminiLiveTranscriptionLink::GeminiLiveTranscriptionLink(const TranscriptionConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

GeminiLiveTranscriptionLink::~GeminiLiveTranscriptionLink() = default;

Result<void> GeminiLiveTranscriptionLink::connect(TranscriptionHandler handler) {
    return pimpl_->connect(std::move(handler));
}

Result<void> GeminiLiveTranscriptionLink::send_audio(const EncodedChunk& chunk) {
    return pimpl_->send_audio(chunk);
}

void GeminiLiveTranscriptionLink::close() {
    pimpl_->close();
}

} // namespace wayfarer

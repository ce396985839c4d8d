#pragma once

#include "common.h"
#include <string>
#include <cstdint>

namespace wayfarer {

struct AudioConfig {
    std::string input_device = "default";   ///< Device name, numeric index, or "default"
    std::string output_device = "default";
    int capture_sample_rate = CAPTURE_SAMPLE_RATE;
    int frame_samples = CAPTURE_FRAME_SAMPLES;   ///< Samples per forwarded capture chunk
    int playback_sample_rate = PLAYBACK_SAMPLE_RATE;
};

/// Streaming speech-to-text service (websocket)
struct TranscriptionConfig {
    std::string endpoint = "wss://generativelanguage.googleapis.com/ws/"
                           "google.ai.generativelanguage.v1beta.GenerativeService.BidiGenerateContent";
    std::string model = "models/gemini-2.5-flash-native-audio-preview-09-2025";
    std::string api_key;                        ///< Inline key; wins over api_key_env
    std::string api_key_env = "GEMINI_API_KEY"; ///< Environment variable holding the key
    std::string voice_name = "Puck";
    std::string system_instruction =
        "You are a transcription machine. Convert the user's speech to English text using the "
        "Latin alphabet only. Transcribe place names as spoken (for example \"San Jose\", "
        "\"Mumbai\"). Do not answer questions or provide assistance.";
    bool verify_tls = true;

    /// Resolve the key from api_key or the configured environment variable
    std::string resolved_api_key() const;
};

/// Travel-planning AI backend
struct BackendConfig {
    std::string base_url = "http://localhost:8000";
    std::string chat_path = "/api/chat";
    int timeout_ms = 30000;
    int connect_timeout_ms = 2000;

    std::string chat_endpoint() const;
};

/// Spoken replies (Piper)
struct SpeechConfig {
    bool enabled = true;
    bool start_muted = false;
    std::string piper_path;        ///< Piper binary path (empty = auto-detect)
    std::string voice_path;        ///< Piper voice model (.onnx)
    std::string espeak_data_path;  ///< espeak-ng data dir (empty = platform default)
    std::string output_device = "default";
    float output_gain = 1.0f;
};

struct SessionConfig {
    std::string apology_text = "Sorry, I encountered an error. Please try again.";
    std::string session_id_prefix = "session";
    bool play_service_audio = false;  ///< Play the transcription service's own voice output
};

struct Config {
    AudioConfig audio;
    TranscriptionConfig transcription;
    BackendConfig backend;
    SpeechConfig speech;
    SessionConfig session;

    std::string log_level = "info";
    std::string log_file;

    /**
     * @brief Load JSON config; a directory resolves to <dir>/config.json.
     * Missing or malformed files log and fall back to defaults.
     */
    static Config load_from_file(const std::string& path);

    /**
     * @brief Parse config from a JSON document string (defaults for absent keys)
     */
    static Config from_json_string(const std::string& text);

    void save_to_file(const std::string& path) const;
};

} // namespace wayfarer

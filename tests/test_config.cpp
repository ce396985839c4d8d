/**
 * Config loading, session ids and log level parsing.
 * Asserts:
 * - Absent keys keep defaults; present keys override them.
 * - A directory path resolves to <dir>/config.json; missing files fall back to defaults.
 * - save_to_file() output loads back.
 * - Session ids follow "<prefix>-<epoch ms>-<9 base36 chars>" and differ per call.
 *
 * Run from build dir: ./test_config
 */

#include "config.h"
#include "logger.h"
#include "utils.h"
#include "test_fakes.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace wayfarer;
namespace fs = std::filesystem;

int main() {
    Logger::initialize(LogLevel::ERROR);

    // --- defaults ---
    {
        Config cfg = Config::from_json_string("{}");
        ASSERT(cfg.audio.capture_sample_rate == 16000);
        ASSERT(cfg.audio.frame_samples == 4096);
        ASSERT(cfg.audio.playback_sample_rate == 24000);
        ASSERT(cfg.backend.chat_endpoint() == "http://localhost:8000/api/chat");
        ASSERT(cfg.speech.enabled);
        ASSERT(!cfg.session.play_service_audio);
        ASSERT(!cfg.session.apology_text.empty());
        ASSERT(cfg.log_level == "info");
    }

    // --- overrides; wrong types are ignored ---
    {
        Config cfg = Config::from_json_string(R"({
            "audio": {"input_device": "USB Mic", "frame_samples": 2048},
            "transcription": {"model": "models/other", "api_key": "k123", "verify_tls": false},
            "backend": {"base_url": "http://travel.local:9000/", "chat_path": "v2/chat", "timeout_ms": "fast"},
            "speech": {"start_muted": true, "output_gain": 0.5},
            "session": {"apology_text": "Oops.", "session_id_prefix": "trip", "play_service_audio": true},
            "log_level": "debug"
        })");
        ASSERT(cfg.audio.input_device == "USB Mic");
        ASSERT(cfg.audio.frame_samples == 2048);
        ASSERT(cfg.transcription.model == "models/other");
        ASSERT(cfg.transcription.resolved_api_key() == "k123");
        ASSERT(!cfg.transcription.verify_tls);
        ASSERT(cfg.backend.chat_endpoint() == "http://travel.local:9000/v2/chat");
        ASSERT(cfg.backend.timeout_ms == 30000);
        ASSERT(cfg.speech.start_muted);
        ASSERT(cfg.speech.output_gain == 0.5f);
        ASSERT(cfg.session.apology_text == "Oops.");
        ASSERT(cfg.session.session_id_prefix == "trip");
        ASSERT(cfg.session.play_service_audio);
        ASSERT(parse_log_level(cfg.log_level) == LogLevel::DEBUG);
    }

    // --- malformed JSON falls back to defaults ---
    {
        Config cfg = Config::from_json_string("{ not json");
        ASSERT(cfg.backend.base_url == "http://localhost:8000");
    }

    // --- API key from the environment ---
    {
        TranscriptionConfig t;
        t.api_key_env = "WAYFARER_TEST_KEY";
        setenv("WAYFARER_TEST_KEY", "from-env", 1);
        ASSERT(t.resolved_api_key() == "from-env");
        unsetenv("WAYFARER_TEST_KEY");
        ASSERT(t.resolved_api_key().empty());
    }

    // --- directory load, missing file, save/load ---
    {
        fs::path dir = fs::temp_directory_path() / ("wayfarer_config_test_" + std::to_string(::getpid()));
        fs::create_directories(dir);

        Config missing = Config::load_from_file((dir / "nope.json").string());
        ASSERT(missing.backend.base_url == "http://localhost:8000");

        {
            std::ofstream out(dir / "config.json");
            out << R"({"backend": {"base_url": "http://10.0.0.5:8000"}})";
        }
        Config from_dir = Config::load_from_file(dir.string());
        ASSERT(from_dir.backend.base_url == "http://10.0.0.5:8000");

        Config original;
        original.session.session_id_prefix = "roundtrip";
        original.audio.output_device = "Speakers";
        original.speech.enabled = false;
        std::string saved = (dir / "saved.json").string();
        original.save_to_file(saved);
        Config loaded = Config::load_from_file(saved);
        ASSERT(loaded.session.session_id_prefix == "roundtrip");
        ASSERT(loaded.audio.output_device == "Speakers");
        ASSERT(!loaded.speech.enabled);

        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    // --- log levels ---
    {
        ASSERT(parse_log_level("WARN") == LogLevel::WARN);
        ASSERT(parse_log_level("warning") == LogLevel::WARN);
        ASSERT(parse_log_level(" error ") == LogLevel::ERROR);
        ASSERT(parse_log_level("verbose") == LogLevel::INFO);
    }

    // --- session ids ---
    {
        std::string a = utils::make_session_id("session");
        std::string b = utils::make_session_id("session");
        ASSERT(a != b);
        ASSERT(a.rfind("session-", 0) == 0);
        size_t last_dash = a.find_last_of('-');
        ASSERT(last_dash != std::string::npos);
        std::string suffix = a.substr(last_dash + 1);
        ASSERT(suffix.size() == 9);
        bool base36 = true;
        for (char c : suffix) {
            if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'z'))) base36 = false;
        }
        ASSERT(base36);
        std::string millis = a.substr(8, last_dash - 8);
        ASSERT(!millis.empty());
        ASSERT(millis.find_first_not_of("0123456789") == std::string::npos);
    }

    // --- text helpers ---
    {
        ASSERT(utils::trim_copy("  San Jose \n") == "San Jose");
        ASSERT(utils::is_empty_or_whitespace(" \t\n"));
        ASSERT(utils::preview("abcdef", 3) == "abc...");
    }

    Logger::shutdown();

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All config tests passed.\n";
    return 0;
}

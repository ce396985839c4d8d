#include "config.h"
#include "logger.h"
#include "path_utils.h"
#include <cstdlib>
#include <fstream>
#include <filesystem>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

/// Apply full JSON config (all sections) into cfg; absent keys keep their defaults.
void apply_json_to_config(wayfarer::Config& cfg, const json& j) {
    if (j.contains("audio") && j["audio"].is_object()) {
        const auto& a = j["audio"];
        if (a.contains("input_device") && a["input_device"].is_string()) cfg.audio.input_device = a["input_device"];
        if (a.contains("output_device") && a["output_device"].is_string()) cfg.audio.output_device = a["output_device"];
        if (a.contains("capture_sample_rate") && a["capture_sample_rate"].is_number_integer())
            cfg.audio.capture_sample_rate = a["capture_sample_rate"];
        if (a.contains("frame_samples") && a["frame_samples"].is_number_integer()) cfg.audio.frame_samples = a["frame_samples"];
        if (a.contains("playback_sample_rate") && a["playback_sample_rate"].is_number_integer())
            cfg.audio.playback_sample_rate = a["playback_sample_rate"];
    }

    if (j.contains("transcription") && j["transcription"].is_object()) {
        const auto& t = j["transcription"];
        if (t.contains("endpoint") && t["endpoint"].is_string()) cfg.transcription.endpoint = t["endpoint"];
        if (t.contains("model") && t["model"].is_string()) cfg.transcription.model = t["model"];
        if (t.contains("api_key") && t["api_key"].is_string()) cfg.transcription.api_key = t["api_key"];
        if (t.contains("api_key_env") && t["api_key_env"].is_string()) cfg.transcription.api_key_env = t["api_key_env"];
        if (t.contains("voice_name") && t["voice_name"].is_string()) cfg.transcription.voice_name = t["voice_name"];
        if (t.contains("system_instruction") && t["system_instruction"].is_string())
            cfg.transcription.system_instruction = t["system_instruction"];
        if (t.contains("verify_tls") && t["verify_tls"].is_boolean()) cfg.transcription.verify_tls = t["verify_tls"];
    }

    if (j.contains("backend") && j["backend"].is_object()) {
        const auto& b = j["backend"];
        if (b.contains("base_url") && b["base_url"].is_string()) cfg.backend.base_url = b["base_url"];
        if (b.contains("chat_path") && b["chat_path"].is_string()) cfg.backend.chat_path = b["chat_path"];
        if (b.contains("timeout_ms") && b["timeout_ms"].is_number_integer()) cfg.backend.timeout_ms = b["timeout_ms"];
        if (b.contains("connect_timeout_ms") && b["connect_timeout_ms"].is_number_integer())
            cfg.backend.connect_timeout_ms = b["connect_timeout_ms"];
    }

    if (j.contains("speech") && j["speech"].is_object()) {
        const auto& s = j["speech"];
        if (s.contains("enabled") && s["enabled"].is_boolean()) cfg.speech.enabled = s["enabled"];
        if (s.contains("start_muted") && s["start_muted"].is_boolean()) cfg.speech.start_muted = s["start_muted"];
        if (s.contains("piper_path") && s["piper_path"].is_string()) cfg.speech.piper_path = s["piper_path"];
        if (s.contains("voice_path") && s["voice_path"].is_string()) cfg.speech.voice_path = s["voice_path"];
        if (s.contains("espeak_data_path") && s["espeak_data_path"].is_string())
            cfg.speech.espeak_data_path = s["espeak_data_path"];
        if (s.contains("output_device") && s["output_device"].is_string()) cfg.speech.output_device = s["output_device"];
        if (s.contains("output_gain") && s["output_gain"].is_number()) cfg.speech.output_gain = s["output_gain"];
    }

    if (j.contains("session") && j["session"].is_object()) {
        const auto& s = j["session"];
        if (s.contains("apology_text") && s["apology_text"].is_string()) cfg.session.apology_text = s["apology_text"];
        if (s.contains("session_id_prefix") && s["session_id_prefix"].is_string())
            cfg.session.session_id_prefix = s["session_id_prefix"];
        if (s.contains("play_service_audio") && s["play_service_audio"].is_boolean())
            cfg.session.play_service_audio = s["play_service_audio"];
    }

    if (j.contains("log_level") && j["log_level"].is_string()) cfg.log_level = j["log_level"];
    if (j.contains("log_file") && j["log_file"].is_string()) cfg.log_file = j["log_file"];
}

void expand_paths(wayfarer::Config& cfg) {
    if (!cfg.speech.piper_path.empty()) cfg.speech.piper_path = wayfarer::expand_path(cfg.speech.piper_path);
    if (!cfg.speech.voice_path.empty()) cfg.speech.voice_path = wayfarer::expand_path(cfg.speech.voice_path);
    if (cfg.speech.espeak_data_path.empty())
        cfg.speech.espeak_data_path = wayfarer::default_espeak_data_path();
    else
        cfg.speech.espeak_data_path = wayfarer::expand_path(cfg.speech.espeak_data_path);
    if (!cfg.log_file.empty()) cfg.log_file = wayfarer::expand_path(cfg.log_file);
}

} // anonymous namespace

namespace wayfarer {

std::string TranscriptionConfig::resolved_api_key() const {
    if (!api_key.empty()) return api_key;
    if (api_key_env.empty()) return "";
    const char* env = std::getenv(api_key_env.c_str());
    return env ? std::string(env) : std::string();
}

std::string BackendConfig::chat_endpoint() const {
    std::string base = base_url;
    while (!base.empty() && base.back() == '/') base.pop_back();
    std::string path = chat_path;
    if (!path.empty() && path.front() != '/') path = "/" + path;
    return base + path;
}

Config Config::from_json_string(const std::string& text) {
    Config cfg;
    json j;
    try {
        j = json::parse(text);
    } catch (const json::exception& e) {
        Logger::error("Error parsing config JSON: " + std::string(e.what()));
        expand_paths(cfg);
        return cfg;
    }
    apply_json_to_config(cfg, j);
    expand_paths(cfg);
    return cfg;
}

Config Config::load_from_file(const std::string& path) {
    std::string file_path = path;
    std::error_code ec;
    if (fs::is_directory(path, ec) && !ec) {
        file_path = (fs::path(path) / "config.json").string();
    }

    std::ifstream file(file_path);
    if (!file.is_open()) {
        Logger::warn("Could not open config file: " + file_path + ". Using defaults.");
        Config cfg;
        expand_paths(cfg);
        return cfg;
    }

    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    Config cfg = from_json_string(text);
    Logger::info("Loaded config: " + file_path);
    return cfg;
}

void Config::save_to_file(const std::string& path) const {
    json j;
    j["audio"] = {
        {"input_device", audio.input_device},
        {"output_device", audio.output_device},
        {"capture_sample_rate", audio.capture_sample_rate},
        {"frame_samples", audio.frame_samples},
        {"playback_sample_rate", audio.playback_sample_rate}
    };
    j["transcription"] = {
        {"endpoint", transcription.endpoint},
        {"model", transcription.model},
        {"api_key_env", transcription.api_key_env},
        {"voice_name", transcription.voice_name},
        {"system_instruction", transcription.system_instruction},
        {"verify_tls", transcription.verify_tls}
    };
    j["backend"] = {
        {"base_url", backend.base_url},
        {"chat_path", backend.chat_path},
        {"timeout_ms", backend.timeout_ms},
        {"connect_timeout_ms", backend.connect_timeout_ms}
    };
    j["speech"] = {
        {"enabled", speech.enabled},
        {"start_muted", speech.start_muted},
        {"piper_path", speech.piper_path},
        {"voice_path", speech.voice_path},
        {"espeak_data_path", speech.espeak_data_path},
        {"output_device", speech.output_device},
        {"output_gain", speech.output_gain}
    };
    j["session"] = {
        {"apology_text", session.apology_text},
        {"session_id_prefix", session.session_id_prefix},
        {"play_service_audio", session.play_service_audio}
    };
    j["log_level"] = log_level;
    j["log_file"] = log_file;

    std::ofstream out(path);
    if (!out.is_open()) {
        Logger::error("Could not write config file: " + path);
        return;
    }
    out << j.dump(2) << std::endl;
}

} // namespace wayfarer

/**
 * @file piper_speech_engine.cpp
 * @brief Piper synthesis and interruptible PortAudio playback
 */

#include "tts/piper_speech_engine.h"
#include "audio_io.h"
#include "common.h"
#include "logger.h"
#include "utils.h"
#include <portaudio.h>
#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <thread>
#include <vector>

namespace wayfarer {
namespace tts {

namespace {

struct WavData {
    AudioBuffer samples;
    int sample_rate = 0;
};

constexpr size_t PLAYBACK_CHUNK_FRAMES = 1024;

/// One synthesis + playback job. Superseded jobs keep running until they
/// notice the cancel flag; the event thread never waits for them.
struct Utterance {
    uint64_t id = 0;
    std::atomic<bool> cancelled{false};
    std::atomic<bool> finished{false};
    std::thread worker;
};

} // namespace

/**
 * @brief Implementation details for PiperSpeechEngine
 */
class PiperSpeechEngine::Impl {
public:
    explicit Impl(const SpeechConfig& config)
        : config_(config)
        , piper_path_cached_(false)
    {
        std::ostringstream oss;
        oss << "PiperSpeechEngine: voice=" << config.voice_path
            << ", gain=" << config.output_gain
            << ", device=" << config.output_device;
        LOG_TTS(oss.str());
    }

    ~Impl() {
        cancel();
        std::lock_guard<std::mutex> lock(worker_mutex_);
        for (auto& utterance : retired_) {
            if (utterance->worker.joinable() && utterance->worker.get_id() != std::this_thread::get_id()) {
                utterance->worker.join();
            } else if (utterance->worker.joinable()) {
                utterance->worker.detach();
            }
        }
        retired_.clear();
    }

    Result<void> warmup() {
        auto result = find_piper();
        if (result.is_error()) {
            return result;
        }
        std::ifstream voice_file(config_.voice_path);
        if (!voice_file.good()) {
            return make_speech_error("Voice model not found: " + config_.voice_path);
        }
        return Result<void>();
    }

    Result<void> speak(const std::string& text, SpeechCallbacks callbacks) {
        cancel();

        std::lock_guard<std::mutex> lock(worker_mutex_);
        reap_finished();
        auto utterance = std::make_shared<Utterance>();
        utterance->id = ++next_utterance_id_;
        try {
            utterance->worker = std::thread(&Impl::run_utterance, this, utterance.get(), text, std::move(callbacks));
        } catch (const std::system_error& e) {
            return make_speech_error(std::string("Failed to start speech worker: ") + e.what());
        }
        current_ = std::move(utterance);
        return Result<void>();
    }

    /**
     * Flags the current utterance and returns without waiting. Piper may be
     * mid-synthesis; the worker exits on its own before playback.
     */
    void cancel() {
        std::lock_guard<std::mutex> lock(worker_mutex_);
        if (!current_) {
            return;
        }
        current_->cancelled = true;
        retired_.push_back(std::move(current_));
        reap_finished();
    }

private:
    // =========================================================================
    // Worker
    // =========================================================================

    /// Join workers that have already returned; never blocks on a running one
    void reap_finished() {
        auto it = retired_.begin();
        while (it != retired_.end()) {
            Utterance& utterance = **it;
            if (!utterance.finished || utterance.worker.get_id() == std::this_thread::get_id()) {
                ++it;
                continue;
            }
            if (utterance.worker.joinable()) {
                utterance.worker.join();
            }
            it = retired_.erase(it);
        }
    }

    void run_utterance(Utterance* utterance, std::string text, SpeechCallbacks callbacks) {
        struct FinishedMark {
            std::atomic<bool>& flag;
            ~FinishedMark() { flag = true; }
        } finished_mark{utterance->finished};

        const std::atomic<bool>& cancelled = utterance->cancelled;
        auto fail = [&](const std::string& message) {
            LOG_TTS("Speech failed: " + message);
            if (!cancelled && callbacks.on_error) {
                callbacks.on_error(message);
            }
        };

        auto wav = synthesize(text, utterance->id);
        if (cancelled) {
            LOG_TTS("Speech cancelled before playback");
            return;
        }
        if (wav.is_error()) {
            fail(wav.error().message);
            return;
        }

        auto played = play(wav.value(), callbacks, cancelled);
        if (cancelled) {
            LOG_TTS("Speech cancelled");
            return;
        }
        if (played.is_error()) {
            fail(played.error().message);
            return;
        }
        if (callbacks.on_end) {
            callbacks.on_end();
        }
    }

    Result<void> play(const WavData& wav, const SpeechCallbacks& callbacks, const std::atomic<bool>& cancelled) {
        PaError err = Pa_Initialize();
        if (err != paNoError) {
            return make_speech_error("PortAudio init error: " + std::string(Pa_GetErrorText(err)));
        }

        int output_idx = audio_devices::find_device(config_.output_device, false);
        const PaDeviceInfo* info = output_idx >= 0 ? Pa_GetDeviceInfo(output_idx) : nullptr;
        if (!info) {
            Pa_Terminate();
            return make_speech_error("Output device not found: " + config_.output_device);
        }

        PaStreamParameters output_params;
        output_params.device = output_idx;
        output_params.channelCount = 1;
        output_params.sampleFormat = paInt16;
        output_params.suggestedLatency = info->defaultLowOutputLatency;
        output_params.hostApiSpecificStreamInfo = nullptr;

        PaStream* stream = nullptr;
        err = Pa_OpenStream(&stream, nullptr, &output_params, wav.sample_rate,
                            PLAYBACK_CHUNK_FRAMES, paClipOff, nullptr, nullptr);
        if (err != paNoError) {
            Pa_Terminate();
            return make_speech_error("Failed to open speech output: " + std::string(Pa_GetErrorText(err)));
        }

        err = Pa_StartStream(stream);
        if (err != paNoError) {
            Pa_CloseStream(stream);
            Pa_Terminate();
            return make_speech_error("Failed to start speech output: " + std::string(Pa_GetErrorText(err)));
        }

        if (!cancelled && callbacks.on_start) {
            callbacks.on_start();
        }

        Result<void> result;
        size_t offset = 0;
        while (offset < wav.samples.size() && !cancelled) {
            size_t frames = std::min(PLAYBACK_CHUNK_FRAMES, wav.samples.size() - offset);
            err = Pa_WriteStream(stream, wav.samples.data() + offset, frames);
            if (err != paNoError && err != paOutputUnderflowed) {
                result = make_speech_error("Speech playback error: " + std::string(Pa_GetErrorText(err)));
                break;
            }
            offset += frames;
        }

        if (cancelled) {
            Pa_AbortStream(stream);
        } else {
            Pa_StopStream(stream);
        }
        Pa_CloseStream(stream);
        Pa_Terminate();
        return result;
    }

    // =========================================================================
    // Piper Interaction
    // =========================================================================

    Result<void> find_piper() {
        std::lock_guard<std::mutex> lock(path_mutex_);
        if (piper_path_cached_) {
            return Result<void>();
        }

        if (!config_.piper_path.empty()) {
            std::ifstream test(config_.piper_path);
            if (test.good()) {
                cached_piper_path_ = config_.piper_path;
                piper_path_cached_ = true;
                LOG_TTS("Using custom piper path: " + cached_piper_path_);
                return Result<void>();
            }
            return make_speech_error("Custom piper path not found: " + config_.piper_path);
        }

        const std::vector<std::string> search_paths = {
            "/usr/local/bin/piper",
            "/opt/homebrew/bin/piper",
            "/usr/bin/piper"
        };

        for (const auto& path : search_paths) {
            std::ifstream test(path);
            if (test.good()) {
                cached_piper_path_ = path;
                piper_path_cached_ = true;
                LOG_TTS("Found piper at: " + cached_piper_path_);
                return Result<void>();
            }
        }

        std::string which_out = "/tmp/wayfarer_piper_path";
        std::string which_cmd = "which piper > " + which_out + " 2>/dev/null";
        if (std::system(which_cmd.c_str()) == 0) {
            std::ifstream path_file(which_out);
            if (path_file.good()) {
                std::getline(path_file, cached_piper_path_);
                utils::trim(cached_piper_path_);
                if (!cached_piper_path_.empty()) {
                    piper_path_cached_ = true;
                    LOG_TTS("Found piper in PATH: " + cached_piper_path_);
                    return Result<void>();
                }
            }
        }

        return make_speech_error("Piper binary not found. Install piper or set speech.piper_path in config.");
    }

    Result<WavData> synthesize(const std::string& text, uint64_t utterance_id) {
        auto find_result = find_piper();
        if (find_result.is_error()) {
            return find_result.error();
        }

        auto start_time = Clock::now();
        std::string temp_wav = "/tmp/wayfarer_tts_" +
            std::to_string(Clock::now().time_since_epoch().count()) + "_" +
            std::to_string(utterance_id) + ".wav";

        std::ostringstream cmd;
        cmd << "echo \"" << escape_for_shell(text) << "\" | "
            << cached_piper_path_
            << " --model " << config_.voice_path
            << " --espeak_data " << config_.espeak_data_path
            << " --output_file " << temp_wav
            << " 2>/dev/null";

        LOG_TTS("Synthesizing: \"" + utils::preview(text) + "\"");

        int ret = std::system(cmd.str().c_str());
        if (ret != 0) {
            std::remove(temp_wav.c_str());
            return make_speech_error("Piper command failed with code: " + std::to_string(ret));
        }

        auto wav = read_wav(temp_wav);
        std::remove(temp_wav.c_str());
        if (wav.is_error()) {
            return wav;
        }

        apply_gain(wav.value().samples);

        std::ostringstream timing;
        timing << "Synthesized " << wav.value().samples.size() << " samples in " << ms_since(start_time) << "ms";
        LOG_TTS(timing.str());
        return wav;
    }

    static std::string escape_for_shell(const std::string& text) {
        std::string escaped;
        escaped.reserve(text.size());
        for (char c : text) {
            if (c == '"' || c == '$' || c == '`' || c == '\\') {
                escaped += '\\';
            }
            escaped += c;
        }
        return escaped;
    }

    // =========================================================================
    // Audio Processing
    // =========================================================================

    Result<WavData> read_wav(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            return make_speech_error("Failed to open WAV file: " + path);
        }

        char riff[12];
        file.read(riff, 12);
        if (file.gcount() < 12 || std::string(riff, 4) != "RIFF" || std::string(riff + 8, 4) != "WAVE") {
            return make_speech_error("Invalid WAV header: " + path);
        }

        auto read_u16 = [](const char* p) -> uint16_t {
            return static_cast<uint8_t>(p[0]) | (static_cast<uint8_t>(p[1]) << 8);
        };
        auto read_u32 = [](const char* p) -> uint32_t {
            return static_cast<uint8_t>(p[0]) |
                   (static_cast<uint8_t>(p[1]) << 8) |
                   (static_cast<uint8_t>(p[2]) << 16) |
                   (static_cast<uint32_t>(static_cast<uint8_t>(p[3])) << 24);
        };

        WavData wav;
        int channels = 1;
        bool have_format = false;

        // Walk chunks until "data"
        char chunk_header[8];
        while (file.read(chunk_header, 8)) {
            std::string id(chunk_header, 4);
            uint32_t size = read_u32(chunk_header + 4);

            if (id == "fmt ") {
                std::vector<char> fmt(size);
                file.read(fmt.data(), size);
                if (size < 16 || static_cast<uint32_t>(file.gcount()) < size) {
                    return make_speech_error("Truncated WAV fmt chunk");
                }
                channels = read_u16(fmt.data() + 2);
                wav.sample_rate = static_cast<int>(read_u32(fmt.data() + 4));
                int bits = read_u16(fmt.data() + 14);
                if (bits != 16) {
                    return make_speech_error("Unsupported WAV bit depth: " + std::to_string(bits));
                }
                have_format = true;
            } else if (id == "data") {
                if (!have_format) {
                    return make_speech_error("WAV data before fmt chunk");
                }
                std::vector<char> raw(size);
                file.read(raw.data(), size);
                size_t bytes = static_cast<size_t>(file.gcount());
                size_t frame_bytes = 2 * static_cast<size_t>(std::max(channels, 1));
                wav.samples.reserve(bytes / frame_bytes);
                // Keep the first channel
                for (size_t i = 0; i + frame_bytes <= bytes; i += frame_bytes) {
                    wav.samples.push_back(static_cast<Sample>(read_u16(raw.data() + i)));
                }
                break;
            } else {
                file.seekg(size + (size & 1), std::ios::cur);
            }
        }

        if (wav.samples.empty() || wav.sample_rate <= 0) {
            return make_speech_error("Failed to read synthesized audio");
        }

        std::ostringstream info;
        info << "WAV: " << wav.sample_rate << "Hz, " << channels << "ch, " << wav.samples.size() << " samples";
        LOG_TTS(info.str());
        return wav;
    }

    void apply_gain(AudioBuffer& audio) const {
        if (std::abs(config_.output_gain - 1.0f) < 0.001f) return;

        for (auto& sample : audio) {
            float scaled = static_cast<float>(sample) * config_.output_gain;
            sample = static_cast<Sample>(std::clamp(scaled, -32768.0f, 32767.0f));
        }
    }

    // =========================================================================
    // Member Variables
    // =========================================================================

    SpeechConfig config_;

    std::mutex path_mutex_;
    std::string cached_piper_path_;
    bool piper_path_cached_;

    std::mutex worker_mutex_;
    std::shared_ptr<Utterance> current_;
    std::vector<std::shared_ptr<Utterance>> retired_;
    uint64_t next_utterance_id_ = 0;
};

// =============================================================================
// Public Interface Implementation
// =============================================================================

PiperSpeechEngine::PiperSpeechEngine(const SpeechConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

PiperSpeechEngine::~PiperSpeechEngine() = default;

Result<void> PiperSpeechEngine::speak(const std::string& text, SpeechCallbacks callbacks) {
    return impl_->speak(text, std::move(callbacks));
}

void PiperSpeechEngine::cancel() {
    impl_->cancel();
}

Result<void> PiperSpeechEngine::warmup() {
    return impl_->warmup();
}

} // namespace tts
} // namespace wayfarer

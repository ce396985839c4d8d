#include "audio_io.h"
#include "backend_client.h"
#include "config.h"
#include "dispatch_executor.h"
#include "logger.h"
#include "session_orchestrator.h"
#include "transcript.h"
#include "transcription_link.h"
#include "tts/piper_speech_engine.h"
#include "utils.h"
#include "visual_state.h"
#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <poll.h>
#include <thread>
#include <unistd.h>

namespace wayfarer {

static std::atomic<bool> g_running(true);

void signal_handler(int signal) {
    (void)signal;
    g_running = false;
}

/**
 * @brief Prints view changes and a short payload summary
 */
class ConsoleVisualSink : public IVisualStateSink {
public:
    void set_visual_data(const nlohmann::json& payload) override {
        if (payload.is_null()) {
            std::cout << "[panel] cleared" << std::endl;
            return;
        }
        size_t count = payload.is_array() ? payload.size() : 1;
        std::cout << "[panel] " << count << " item(s): " << utils::preview(payload.dump(), 120) << std::endl;
    }

    void set_view_mode(ViewMode mode) override {
        std::cout << "[panel] view=" << view_mode_name(mode) << std::endl;
    }

    void set_thinking(bool thinking) override {
        if (thinking) {
            std::cout << "[panel] thinking..." << std::endl;
        }
    }
};

static std::string default_config_path() {
    std::string config_path = "config";
    // Try config directory relative to executable (e.g. build/../config)
    char buf[1024];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len != -1) {
        buf[len] = '\0';
        std::string exe_dir(buf);
        size_t pos = exe_dir.find_last_of('/');
        if (pos != std::string::npos) {
            exe_dir = exe_dir.substr(0, pos);
            std::string config_dir = exe_dir + "/../config";
            std::ifstream test(config_dir + "/config.json");
            if (test.good()) {
                config_path = config_dir;
            }
        }
    }
    return config_path;
}

static void print_help() {
    std::cout << "Commands: mute | unmute | toggle | stop | start | quit" << std::endl;
}

static void handle_command(const std::string& line, SessionOrchestrator& session) {
    std::string cmd = utils::normalize_copy(utils::trim_copy(line));
    if (cmd.empty()) {
        return;
    }
    if (cmd == "mute") {
        session.mute_speech();
        std::cout << "Speech output muted" << std::endl;
    } else if (cmd == "unmute") {
        session.unmute_speech();
        std::cout << "Speech output unmuted" << std::endl;
    } else if (cmd == "toggle") {
        bool muted = session.toggle_speech_mute();
        std::cout << "Speech output " << (muted ? "muted" : "unmuted") << std::endl;
    } else if (cmd == "stop") {
        session.stop();
    } else if (cmd == "start") {
        auto started = session.start();
        if (started.is_error()) {
            std::cout << "Cannot start: " << started.error().message << std::endl;
        }
    } else if (cmd == "quit" || cmd == "exit") {
        g_running = false;
    } else {
        print_help();
    }
}

} // namespace wayfarer

int main(int argc, char* argv[]) {
    using namespace wayfarer;

    Logger::initialize(LogLevel::INFO);

    if (argc > 1 && std::string(argv[1]) == "--list-devices") {
        audio_devices::list_devices();
        Logger::shutdown();
        return 0;
    }

    std::string config_path = argc > 1 ? argv[1] : default_config_path();
    Config config = Config::load_from_file(config_path);

    Logger::shutdown();
    Logger::initialize(parse_log_level(config.log_level), config.log_file);

    auto transcript = std::make_shared<TranscriptLog>();
    transcript->set_on_change([](size_t index, const TranscriptEntry& entry) {
        std::cout << "#" << index << " [" << speaker_name(entry.speaker) << "] " << entry.text
                  << (entry.is_final ? "" : " ...") << std::endl;
    });

    SessionCollaborators collab;
    collab.transport = std::make_shared<GeminiLiveTranscriptionLink>(config.transcription);
    collab.microphone = std::make_shared<PortAudioMicrophone>(config.audio.input_device,
                                                              config.audio.capture_sample_rate);
    if (config.session.play_service_audio) {
        collab.playback = std::make_shared<PortAudioPlaybackDevice>(config.audio.output_device,
                                                                    config.audio.playback_sample_rate);
    }
    if (config.speech.enabled) {
        auto piper = std::make_shared<tts::PiperSpeechEngine>(config.speech);
        auto warm = piper->warmup();
        if (warm.is_error()) {
            Logger::warn("Spoken replies unavailable: " + warm.error().message);
        }
        collab.speech = piper;
    }
    collab.backend = std::make_shared<BackendDispatchClient>(config.backend);
    auto executor = std::make_shared<ThreadedDispatchExecutor>();
    collab.executor = executor;
    collab.transcript = transcript;
    collab.visual = std::make_shared<ConsoleVisualSink>();

    SessionOrchestrator session(config, collab, [](const std::string& reason) {
        std::cout << "Session closed: " << reason << " (type 'start' to begin a new one)" << std::endl;
    });

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::thread event_loop([&session]() {
        while (g_running) {
            session.process_next(std::chrono::milliseconds(100));
        }
    });

    auto started = session.start();
    if (started.is_error()) {
        Logger::error("Failed to start session: " + started.error().message);
        g_running = false;
    } else {
        print_help();
    }

    // Poll stdin so a signal can end the loop without waiting for input
    while (g_running) {
        struct pollfd pfd;
        pfd.fd = STDIN_FILENO;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ready = poll(&pfd, 1, 200);
        if (ready <= 0 || !(pfd.revents & (POLLIN | POLLHUP))) {
            continue;
        }
        std::string line;
        if (!std::getline(std::cin, line)) {
            g_running = false;
            break;
        }
        handle_command(line, session);
    }

    Logger::info("Shutting down...");
    if (event_loop.joinable()) {
        event_loop.join();
    }
    session.shutdown();
    executor->shutdown();
    executor->wait_for_completion(2000);

    Logger::shutdown();
    return 0;
}

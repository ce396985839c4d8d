#pragma once

#include <string>
#include <ostream>
#include <memory>

namespace wayfarer {

/**
 * @brief Log levels for filtering output
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * @brief Parse a level name ("debug", "info", "warn", "error"); unknown names map to INFO
 */
LogLevel parse_log_level(const std::string& name);

/**
 * @brief Lightweight, thread-safe logging system
 *
 * Audio callbacks, the transcription socket thread, the speech worker and the
 * session event loop all log through this one sink.
 */
class Logger {
public:
    /**
     * @brief Initialize logger with minimum log level
     * @param min_level Minimum level to output (default: INFO)
     * @param output_file Optional file path for log output (empty = console only)
     */
    static void initialize(LogLevel min_level = LogLevel::INFO,
                           const std::string& output_file = "");

    /**
     * @brief Shutdown logger and close file handles
     */
    static void shutdown();

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    static void set_level(LogLevel level);
    static LogLevel get_level();

private:
    class Impl;
    static std::unique_ptr<Impl> impl_;

    static void log(LogLevel level, const std::string& message);
};

#define LOG_DEBUG(msg) wayfarer::Logger::debug("[" + std::string(__FILE__) + ":" + std::to_string(__LINE__) + "] " + msg)
#define LOG_INFO(msg) wayfarer::Logger::info(msg)
#define LOG_WARN(msg) wayfarer::Logger::warn(msg)
#define LOG_ERROR(msg) wayfarer::Logger::error(msg)

// Component-specific logging macros
#define LOG_CAPTURE(msg) wayfarer::Logger::debug(std::string("[Capture] ") + (msg))
#define LOG_PLAYBACK(msg) wayfarer::Logger::debug(std::string("[Playback] ") + (msg))
#define LOG_STT(msg) wayfarer::Logger::info(std::string("[STT] ") + (msg))
#define LOG_BACKEND(msg) wayfarer::Logger::info(std::string("[Backend] ") + (msg))
#define LOG_TTS(msg) wayfarer::Logger::info(std::string("[TTS] ") + (msg))
#define LOG_SESSION(msg) wayfarer::Logger::info(std::string("[Session] ") + (msg))
#define LOG_TRACE(turn_id, stage, data) wayfarer::Logger::info(std::string("[trace] turn_id=") + std::to_string(turn_id) + " stage=" + (stage) + " " + (data))

} // namespace wayfarer

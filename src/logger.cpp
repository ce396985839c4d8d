#include "logger.h"
#include "utils.h"
#include <iostream>
#include <fstream>
#include <mutex>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <ctime>

namespace wayfarer {

namespace {

const char* level_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

} // namespace

LogLevel parse_log_level(const std::string& name) {
    std::string n = utils::normalize_copy(utils::trim_copy(name));
    if (n == "debug") return LogLevel::DEBUG;
    if (n == "warn" || n == "warning") return LogLevel::WARN;
    if (n == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

class Logger::Impl {
public:
    Impl(LogLevel min_level, const std::string& output_file)
        : min_level_(min_level) {
        if (!output_file.empty()) {
            file_stream_ = std::make_unique<std::ofstream>(output_file, std::ios::app);
            if (!file_stream_->is_open()) {
                std::cerr << "Warning: Failed to open log file: " << output_file << std::endl;
                file_stream_.reset();
            }
        }
    }

    ~Impl() {
        if (file_stream_ && file_stream_->is_open()) {
            file_stream_->close();
        }
    }

    void log(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < min_level_) {
            return;
        }

        // Format: [LEVEL] timestamp: message
        auto now = std::chrono::system_clock::now();
        std::time_t time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;
        std::tm local_tm{};
        localtime_r(&time_t, &local_tm);

        std::ostringstream oss;
        oss << "[" << level_string(level) << "] "
            << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
            << "." << std::setfill('0') << std::setw(3) << ms.count()
            << ": " << message;

        std::string formatted = oss.str();

        if (level >= LogLevel::ERROR) {
            std::cerr << formatted << std::endl;
        } else {
            std::cout << formatted << std::endl;
        }

        if (file_stream_ && file_stream_->is_open()) {
            *file_stream_ << formatted << std::endl;
        }
    }

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    LogLevel get_level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return min_level_;
    }

private:
    mutable std::mutex mutex_;
    LogLevel min_level_;
    std::unique_ptr<std::ofstream> file_stream_;
};

std::unique_ptr<Logger::Impl> Logger::impl_ = nullptr;

void Logger::initialize(LogLevel min_level, const std::string& output_file) {
    if (!impl_) {
        impl_ = std::make_unique<Impl>(min_level, output_file);
    }
}

void Logger::shutdown() {
    impl_.reset();
}

void Logger::log(LogLevel level, const std::string& message) {
    if (impl_) {
        impl_->log(level, message);
        return;
    }
    // Not initialized: console only, DEBUG suppressed
    if (level == LogLevel::DEBUG) {
        return;
    }
    if (level >= LogLevel::ERROR) {
        std::cerr << message << std::endl;
    } else {
        std::cout << message << std::endl;
    }
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warn(const std::string& message) {
    log(LogLevel::WARN, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void Logger::set_level(LogLevel level) {
    if (impl_) {
        impl_->set_level(level);
    }
}

LogLevel Logger::get_level() {
    if (impl_) {
        return impl_->get_level();
    }
    return LogLevel::INFO;
}

} // namespace wayfarer

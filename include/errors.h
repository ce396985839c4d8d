#pragma once

#include <string>
#include <variant>
#include <optional>
#include <stdexcept>

namespace wayfarer {

/**
 * @brief Failure categories surfaced by session components
 *
 * DeviceUnavailable and TransportError end the session.
 * BackendUnavailable and SpeechOutputError are recovered within the turn.
 */
enum class ErrorType {
    None,
    DeviceUnavailable,
    TransportError,
    BackendUnavailable,
    SpeechOutputError,
    EncodingError,
    ParseError,
    InvalidState,
    IOError
};

inline const char* error_type_name(ErrorType type) {
    switch (type) {
        case ErrorType::None: return "None";
        case ErrorType::DeviceUnavailable: return "DeviceUnavailable";
        case ErrorType::TransportError: return "TransportError";
        case ErrorType::BackendUnavailable: return "BackendUnavailable";
        case ErrorType::SpeechOutputError: return "SpeechOutputError";
        case ErrorType::EncodingError: return "EncodingError";
        case ErrorType::ParseError: return "ParseError";
        case ErrorType::InvalidState: return "InvalidState";
        case ErrorType::IOError: return "IOError";
    }
    return "Unknown";
}

/**
 * @brief Error information structure
 */
struct Error {
    ErrorType type = ErrorType::None;
    std::string message;

    Error() = default;
    Error(ErrorType t, const std::string& msg) : type(t), message(msg) {}

    bool is_error() const { return type != ErrorType::None; }
    operator bool() const { return is_error(); }
};

/**
 * @brief Result type for operations that can fail
 *
 * Holds either a value of type T or an Error.
 */
template<typename T>
class Result {
public:
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}

    Result(const Error& error) : data_(error) {}
    Result(Error&& error) : data_(std::move(error)) {}

    bool is_ok() const {
        return std::holds_alternative<T>(data_);
    }

    bool is_error() const {
        return std::holds_alternative<Error>(data_);
    }

    // Get value (throws if error)
    const T& value() const {
        if (!is_ok()) {
            throw std::runtime_error("Result is error, cannot get value");
        }
        return std::get<T>(data_);
    }

    T& value() {
        if (!is_ok()) {
            throw std::runtime_error("Result is error, cannot get value");
        }
        return std::get<T>(data_);
    }

    // Get error (throws if success)
    const Error& error() const {
        if (is_ok()) {
            throw std::runtime_error("Result is success, cannot get error");
        }
        return std::get<Error>(data_);
    }

    T value_or(const T& default_value) const {
        return is_ok() ? std::get<T>(data_) : default_value;
    }

    explicit operator bool() const {
        return is_ok();
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void (success/failure only)
template<>
class Result<void> {
public:
    Result() : is_ok_(true) {}
    Result(const Error& error) : is_ok_(false), error_(error) {}
    Result(Error&& error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok() const { return is_ok_; }
    bool is_error() const { return !is_ok_; }
    const Error& error() const { return error_; }

    explicit operator bool() const { return is_ok_; }

private:
    bool is_ok_;
    Error error_;
};

inline Error make_error(ErrorType type, const std::string& message) {
    return Error(type, message);
}

inline Error make_device_error(const std::string& message) {
    return Error(ErrorType::DeviceUnavailable, message);
}

inline Error make_transport_error(const std::string& message) {
    return Error(ErrorType::TransportError, message);
}

inline Error make_backend_error(const std::string& message) {
    return Error(ErrorType::BackendUnavailable, message);
}

inline Error make_speech_error(const std::string& message) {
    return Error(ErrorType::SpeechOutputError, message);
}

inline Error make_encoding_error(const std::string& message) {
    return Error(ErrorType::EncodingError, message);
}

inline Error make_parse_error(const std::string& message) {
    return Error(ErrorType::ParseError, message);
}

} // namespace wayfarer

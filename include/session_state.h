#pragma once

namespace wayfarer {

/**
 * @brief Voice session lifecycle
 *
 * Idle -> Connecting -> Listening -> Sending -> AwaitingBackend -> ApplyingResult -> Listening
 * Closing -> Closed is reachable from any state.
 */
enum class SessionState {
    Idle,
    Connecting,
    Listening,
    Sending,
    AwaitingBackend,
    ApplyingResult,
    Closing,
    Closed
};

inline const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "IDLE";
        case SessionState::Connecting: return "CONNECTING";
        case SessionState::Listening: return "LISTENING";
        case SessionState::Sending: return "SENDING";
        case SessionState::AwaitingBackend: return "AWAITING_BACKEND";
        case SessionState::ApplyingResult: return "APPLYING_RESULT";
        case SessionState::Closing: return "CLOSING";
        case SessionState::Closed: return "CLOSED";
    }
    return "UNKNOWN";
}

/// Transport open and not yet closing
inline bool is_session_active(SessionState state) {
    switch (state) {
        case SessionState::Listening:
        case SessionState::Sending:
        case SessionState::AwaitingBackend:
        case SessionState::ApplyingResult:
            return true;
        default:
            return false;
    }
}

} // namespace wayfarer

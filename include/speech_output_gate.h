#pragma once

#include "tts/speech_engine.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace wayfarer {

/**
 * @brief Spoken-reply wrapper that reports a balanced start/end lifecycle
 *
 * Every utterance gets an id. on_start fires at most once, when audio really
 * begins; on_end fires exactly once for every utterance that started, whether
 * it completed, failed, or was cut off by a newer speak(), mute() or cancel().
 * An error before audio begins still fires on_end so capture can resume.
 *
 * Lifecycle callbacks run with the gate locked and must not call back into it.
 */
class SpeechOutputGate {
public:
    struct Callbacks {
        std::function<void(uint64_t utterance_id)> on_start;
        std::function<void(uint64_t utterance_id)> on_end;
    };

    SpeechOutputGate(std::shared_ptr<tts::ISpeechEngine> engine, Callbacks callbacks, bool start_muted = false);
    ~SpeechOutputGate();

    SpeechOutputGate(const SpeechOutputGate&) = delete;
    SpeechOutputGate& operator=(const SpeechOutputGate&) = delete;

    /**
     * @brief Speak a reply, replacing anything currently speaking
     * @return Utterance id, or 0 when muted or the text is blank
     */
    uint64_t speak(const std::string& text);

    /// Stop the current utterance, if any
    void cancel();

    /// Silence future replies and cut off the current one
    void mute();
    void unmute();

    /// @return New muted state
    bool toggle_mute();

    bool is_muted() const;
    bool is_speaking() const;

private:
    void cancel_current();
    void handle_start(uint64_t id);
    void handle_end(uint64_t id);

    std::shared_ptr<tts::ISpeechEngine> engine_;
    Callbacks callbacks_;

    mutable std::mutex mutex_;
    bool muted_;
    uint64_t next_id_ = 0;
    uint64_t current_id_ = 0;
    bool started_ = false;
    bool ended_ = true;
};

} // namespace wayfarer

#include "speech_output_gate.h"
#include "logger.h"
#include "utils.h"

namespace wayfarer {

SpeechOutputGate::SpeechOutputGate(std::shared_ptr<tts::ISpeechEngine> engine, Callbacks callbacks, bool start_muted)
    : engine_(std::move(engine)), callbacks_(std::move(callbacks)), muted_(start_muted) {}

SpeechOutputGate::~SpeechOutputGate() {
    cancel_current();
}

uint64_t SpeechOutputGate::speak(const std::string& text) {
    if (is_muted()) {
        LOG_TTS("Muted, not speaking: " + utils::preview(text));
        return 0;
    }
    if (utils::is_empty_or_whitespace(text)) {
        return 0;
    }

    cancel_current();

    uint64_t id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = ++next_id_;
        current_id_ = id;
        started_ = false;
        ended_ = false;
    }

    if (!engine_) {
        handle_end(id);
        return id;
    }

    tts::SpeechCallbacks engine_callbacks;
    engine_callbacks.on_start = [this, id]() { handle_start(id); };
    engine_callbacks.on_end = [this, id]() { handle_end(id); };
    engine_callbacks.on_error = [this, id](const std::string& message) {
        Logger::warn("Speech output error (utterance " + std::to_string(id) + "): " + message);
        handle_end(id);
    };

    auto result = engine_->speak(text, std::move(engine_callbacks));
    if (result.is_error()) {
        Logger::warn("Speech output failed to start: " + result.error().message);
        handle_end(id);
    }
    return id;
}

void SpeechOutputGate::cancel() {
    cancel_current();
}

void SpeechOutputGate::mute() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        muted_ = true;
    }
    LOG_TTS("Speech output muted");
    cancel_current();
}

void SpeechOutputGate::unmute() {
    std::lock_guard<std::mutex> lock(mutex_);
    muted_ = false;
    LOG_TTS("Speech output unmuted");
}

bool SpeechOutputGate::toggle_mute() {
    if (is_muted()) {
        unmute();
        return false;
    }
    mute();
    return true;
}

bool SpeechOutputGate::is_muted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return muted_;
}

bool SpeechOutputGate::is_speaking() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_id_ != 0 && started_ && !ended_;
}

void SpeechOutputGate::cancel_current() {
    bool had_utterance = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (current_id_ != 0 && !ended_) {
            had_utterance = true;
            ended_ = true;
            // Balance a started utterance before the engine is stopped
            if (started_ && callbacks_.on_end) {
                callbacks_.on_end(current_id_);
            }
        }
    }
    if (had_utterance && engine_) {
        engine_->cancel();
    }
}

void SpeechOutputGate::handle_start(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (id != current_id_ || started_ || ended_) {
        return;
    }
    started_ = true;
    if (callbacks_.on_start) {
        callbacks_.on_start(id);
    }
}

void SpeechOutputGate::handle_end(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (id != current_id_ || ended_) {
        return;
    }
    ended_ = true;
    if (callbacks_.on_end) {
        callbacks_.on_end(id);
    }
}

} // namespace wayfarer

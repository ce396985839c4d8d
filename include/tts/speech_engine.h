#pragma once

/**
 * @file speech_engine.h
 * @brief Text-to-speech output interface
 *
 * The engine both synthesizes and plays. Lifecycle is reported through
 * callbacks that may run on an engine-owned thread.
 */

#include "errors.h"
#include <functional>
#include <string>

namespace wayfarer {
namespace tts {

struct SpeechCallbacks {
    std::function<void()> on_start;                       ///< Audio actually began
    std::function<void()> on_end;                         ///< Played to completion
    std::function<void(const std::string&)> on_error;     ///< Synthesis or playback failed
};

class ISpeechEngine {
public:
    virtual ~ISpeechEngine() = default;

    /**
     * @brief Begin speaking text asynchronously
     *
     * Exactly one of on_end/on_error is reported per utterance unless the
     * utterance is cancelled first.
     * @return SpeechOutputError if the utterance could not be started at all
     */
    virtual Result<void> speak(const std::string& text, SpeechCallbacks callbacks) = 0;

    /**
     * @brief Stop the current utterance. No callbacks for it fire after this returns.
     */
    virtual void cancel() = 0;
};

} // namespace tts
} // namespace wayfarer

#pragma once

/**
 * @file piper_speech_engine.h
 * @brief Piper synthesis with PortAudio playback
 *
 * Features:
 * - Piper binary lookup (config, common install paths, PATH), cached
 * - Output gain
 * - Interruptible playback on a worker thread
 */

#include "tts/speech_engine.h"
#include "config.h"
#include <memory>

namespace wayfarer {
namespace tts {

class PiperSpeechEngine : public ISpeechEngine {
public:
    explicit PiperSpeechEngine(const SpeechConfig& config);
    ~PiperSpeechEngine() override;

    // Non-copyable
    PiperSpeechEngine(const PiperSpeechEngine&) = delete;
    PiperSpeechEngine& operator=(const PiperSpeechEngine&) = delete;

    Result<void> speak(const std::string& text, SpeechCallbacks callbacks) override;
    void cancel() override;

    /// Locate the Piper binary and check the voice model without speaking
    Result<void> warmup();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tts
} // namespace wayfarer

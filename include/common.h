#pragma once

#include <cstdint>
#include <vector>
#include <string>
#include <chrono>
#include <memory>

namespace wayfarer {

// Audio types
using Sample = int16_t;
using AudioFrame = std::vector<Sample>;
using AudioBuffer = std::vector<Sample>;

// Timing
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

inline int64_t ms_since(TimePoint start) {
    return std::chrono::duration_cast<Duration>(Clock::now() - start).count();
}

// Capture format expected by the transcription service
constexpr int CAPTURE_SAMPLE_RATE = 16000;
constexpr int CAPTURE_FRAME_SAMPLES = 4096;  // ~256ms per chunk @ 16kHz

// Service audio (model voice) arrives as PCM16 @ 24kHz
constexpr int PLAYBACK_SAMPLE_RATE = 24000;
constexpr int PLAYBACK_CALLBACK_FRAMES = 480;  // 20ms @ 24kHz

/// One captured frame in the transcription service's wire format
struct EncodedChunk {
    std::string mime_type;   ///< e.g. "audio/pcm;rate=16000"
    std::string data;        ///< base64 of PCM16 little-endian samples
    size_t sample_count = 0;
};

} // namespace wayfarer

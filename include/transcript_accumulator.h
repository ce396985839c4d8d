#pragma once

#include "transcript.h"
#include <memory>
#include <string>

namespace wayfarer {

/**
 * @brief Collects the cumulative partial transcripts of one user turn
 *
 * The transcription service sends cumulative text, so each partial replaces
 * the previous one. finalize() freezes the turn exactly once; reset() opens the
 * next turn. User-side transcript entries are emitted to the sink.
 */
class TranscriptAccumulator {
public:
    explicit TranscriptAccumulator(std::shared_ptr<ITranscriptSink> sink);

    /**
     * @brief Replace the turn's text with a newer cumulative partial.
     * No-op once the turn is finalized.
     */
    void append_partial(const std::string& text);

    /**
     * @brief Freeze the turn and emit its final entry.
     * Idempotent: later calls return the same text without emitting again.
     * An empty turn finalizes silently.
     */
    std::string finalize();

    /// Start a new, empty, unfinalized turn
    void reset();

    const std::string& text() const { return text_; }
    bool is_finalized() const { return finalized_; }
    bool has_pending_text() const;

private:
    std::shared_ptr<ITranscriptSink> sink_;
    std::string text_;
    bool finalized_ = false;
};

} // namespace wayfarer

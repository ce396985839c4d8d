#include "transcript_accumulator.h"
#include "logger.h"
#include "utils.h"

namespace wayfarer {

TranscriptAccumulator::TranscriptAccumulator(std::shared_ptr<ITranscriptSink> sink)
    : sink_(std::move(sink)) {}

void TranscriptAccumulator::append_partial(const std::string& text) {
    if (finalized_) {
        LOG_STT("Partial after finalize ignored: " + utils::preview(text));
        return;
    }
    text_ = text;
    if (sink_) {
        sink_->append_or_update(Speaker::User, text_, false);
    }
}

std::string TranscriptAccumulator::finalize() {
    if (finalized_) {
        return text_;
    }
    finalized_ = true;
    if (!utils::is_empty_or_whitespace(text_) && sink_) {
        sink_->append_or_update(Speaker::User, text_, true);
    }
    return text_;
}

void TranscriptAccumulator::reset() {
    text_.clear();
    finalized_ = false;
}

bool TranscriptAccumulator::has_pending_text() const {
    return !finalized_ && !utils::is_empty_or_whitespace(text_);
}

} // namespace wayfarer

#include "transcript.h"
#include "logger.h"
#include "utils.h"

namespace wayfarer {

void TranscriptLog::append_or_update(Speaker speaker, const std::string& text, bool is_final) {
    ChangeCallback callback;
    size_t index = 0;
    TranscriptEntry changed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        TranscriptEntry incoming{speaker, text, is_final};

        if (!entries_.empty() && entries_.back() == incoming) {
            Logger::debug(std::string("Ignoring duplicate ") + speaker_name(speaker) +
                          " transcript: " + utils::preview(text));
            return;
        }

        if (!entries_.empty() && entries_.back().speaker == speaker && !entries_.back().is_final) {
            entries_.back().text = text;
            entries_.back().is_final = is_final;
        } else {
            entries_.push_back(incoming);
        }

        index = entries_.size() - 1;
        changed = entries_.back();
        callback = on_change_;
    }

    if (callback) {
        callback(index, changed);
    }
}

std::vector<TranscriptEntry> TranscriptLog::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

size_t TranscriptLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void TranscriptLog::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

void TranscriptLog::set_on_change(ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_change_ = std::move(callback);
}

} // namespace wayfarer

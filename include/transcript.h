#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <functional>

namespace wayfarer {

enum class Speaker {
    User,
    Ai
};

inline const char* speaker_name(Speaker speaker) {
    return speaker == Speaker::User ? "user" : "ai";
}

/**
 * @brief One visible line of the conversation transcript
 */
struct TranscriptEntry {
    Speaker speaker = Speaker::User;
    std::string text;
    bool is_final = false;

    bool operator==(const TranscriptEntry& other) const {
        return speaker == other.speaker && text == other.text && is_final == other.is_final;
    }
};

/**
 * @brief Receiver of transcript updates (the UI side of the session)
 */
class ITranscriptSink {
public:
    virtual ~ITranscriptSink() = default;

    /**
     * @brief Add a new entry or update the trailing non-final entry of the same speaker
     */
    virtual void append_or_update(Speaker speaker, const std::string& text, bool is_final) = 0;
};

/**
 * @brief Ordered transcript with replace-in-place and duplicate suppression
 *
 * - An exact duplicate of the last entry (speaker, text, finality) is dropped.
 * - An update for the same speaker while the last entry is non-final replaces it.
 * - Anything else is appended.
 * So no two adjacent entries from the same speaker are both non-final.
 */
class TranscriptLog : public ITranscriptSink {
public:
    /// Optional observer called after each change (entry index, entry)
    using ChangeCallback = std::function<void(size_t, const TranscriptEntry&)>;

    void append_or_update(Speaker speaker, const std::string& text, bool is_final) override;

    std::vector<TranscriptEntry> entries() const;
    size_t size() const;
    void clear();

    void set_on_change(ChangeCallback callback);

private:
    mutable std::mutex mutex_;
    std::vector<TranscriptEntry> entries_;
    ChangeCallback on_change_;
};

} // namespace wayfarer

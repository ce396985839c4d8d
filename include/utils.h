#pragma once

#include <string>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <random>

namespace wayfarer {

/**
 * @brief String utility functions
 */
namespace utils {

/**
 * @brief Trim whitespace from both ends of a string
 * @param str String to trim (modified in place)
 * @return Reference to the trimmed string
 */
inline std::string& trim(std::string& str) {
    str.erase(0, str.find_first_not_of(" \t\n\r"));
    str.erase(str.find_last_not_of(" \t\n\r") + 1);
    return str;
}

inline std::string trim_copy(const std::string& str) {
    std::string result = str;
    trim(result);
    return result;
}

/**
 * @brief Lowercase a string in place
 */
inline std::string& normalize(std::string& str) {
    std::transform(str.begin(), str.end(), str.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return str;
}

inline std::string normalize_copy(const std::string& str) {
    std::string result = str;
    normalize(result);
    return result;
}

inline bool is_empty_or_whitespace(const std::string& str) {
    return str.find_first_not_of(" \t\n\r") == std::string::npos;
}

/**
 * @brief Shorten text for log lines ("abc..." past max_chars)
 */
inline std::string preview(const std::string& text, size_t max_chars = 50) {
    if (text.size() <= max_chars) return text;
    return text.substr(0, max_chars) + "...";
}

/**
 * @brief Build a fresh conversation id: "<prefix>-<epoch ms>-<9 base36 chars>"
 *
 * A new id is issued for every session start so the backend never correlates
 * the new session with an earlier conversation.
 */
inline std::string make_session_id(const std::string& prefix = "session") {
    static const char alphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    static thread_local std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<int> pick(0, 35);

    auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    std::string suffix;
    suffix.reserve(9);
    for (int i = 0; i < 9; ++i) {
        suffix += alphabet[pick(rng)];
    }
    return prefix + "-" + std::to_string(epoch_ms) + "-" + suffix;
}

} // namespace utils

} // namespace wayfarer

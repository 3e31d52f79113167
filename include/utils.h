#pragma once

#include <string>
#include <algorithm>
#include <cctype>
#include <vector>

namespace parley {

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
 * @brief Normalize string to lowercase
 * @param str String to normalize (modified in place)
 * @return Reference to the normalized string
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

inline bool starts_with(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

/**
 * @brief Truncate to at most max_bytes without splitting a UTF-8 sequence
 */
inline std::string truncate_utf8(const std::string& str, size_t max_bytes) {
    if (str.size() <= max_bytes) return str;
    size_t cut = max_bytes;
    // Back up over continuation bytes (10xxxxxx)
    while (cut > 0 && (static_cast<unsigned char>(str[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return str.substr(0, cut);
}

/**
 * @brief Check if transcript text is blank (empty/whitespace or equals a blank sentinel)
 * @param text Raw transcript text
 * @param blank_sentinel String to treat as blank (e.g. "[BLANK_AUDIO]"); compared after trim
 * @return True if the recognizer produced nothing worth a turn
 */
inline bool is_blank_transcript(const std::string& text, const std::string& blank_sentinel = "[BLANK_AUDIO]") {
    std::string t = trim_copy(text);
    if (t.empty()) return true;
    if (!blank_sentinel.empty() && t == blank_sentinel) return true;

    // Whisper marks non-speech as "(music)", "[silence]", "*noise*"
    if ((t.front() == '(' && t.back() == ')') ||
        (t.front() == '[' && t.back() == ']') ||
        (t.front() == '*' && t.back() == '*')) {
        return true;
    }

    std::string cleaned;
    for (char c : t) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            cleaned += c;
        }
    }
    return cleaned.empty();
}

} // namespace utils

} // namespace parley

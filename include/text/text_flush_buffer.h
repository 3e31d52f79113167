#pragma once

#include "core/constants.h"
#include <optional>
#include <string>

namespace parley {

/**
 * @brief Accumulates streamed tokens and releases speakable chunks
 *
 * A chunk ends at the last sentence boundary ('.', '!', '?', '\n') in the
 * buffer. Without a boundary the whole buffer is released once it grows
 * past max_chars.
 */
class TextFlushBuffer {
public:
    explicit TextFlushBuffer(size_t max_chars = constants::flush::MAX_CHARS);

    /**
     * @brief Add token text
     * @return The chunk to render now, if any
     */
    std::optional<std::string> append(const std::string& token);

    /**
     * @brief End of turn: release whatever is buffered and reset
     */
    std::optional<std::string> flush();

    void clear() { buffer_.clear(); }

    const std::string& pending() const { return buffer_; }
    bool empty() const { return buffer_.empty(); }

private:
    std::string buffer_;
    size_t max_chars_;
};

} // namespace parley

#include "text/text_flush_buffer.h"

namespace parley {

TextFlushBuffer::TextFlushBuffer(size_t max_chars)
    : max_chars_(max_chars == 0 ? constants::flush::MAX_CHARS : max_chars) {}

std::optional<std::string> TextFlushBuffer::append(const std::string& token) {
    buffer_ += token;

    size_t boundary = buffer_.find_last_of(".!?\n");
    if (boundary != std::string::npos) {
        std::string chunk = buffer_.substr(0, boundary + 1);
        buffer_.erase(0, boundary + 1);
        return chunk;
    }

    if (buffer_.size() > max_chars_) {
        std::string chunk;
        chunk.swap(buffer_);
        return chunk;
    }
    return std::nullopt;
}

std::optional<std::string> TextFlushBuffer::flush() {
    if (buffer_.empty()) {
        return std::nullopt;
    }
    std::string chunk;
    chunk.swap(buffer_);
    return chunk;
}

} // namespace parley

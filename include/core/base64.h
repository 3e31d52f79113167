#pragma once

#include "core/types.h"
#include <string>

namespace parley {
namespace base64 {

std::string encode(const uint8_t* data, size_t len);

inline std::string encode(const ByteBuffer& data) {
    return encode(data.data(), data.size());
}

/**
 * @brief Decode standard base64; stops at the first non-alphabet character
 */
ByteBuffer decode(const std::string& in);

} // namespace base64
} // namespace parley

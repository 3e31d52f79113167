#include "core/base64.h"
#include <array>

namespace parley {
namespace base64 {

namespace {

const char kTable[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::array<int, 256> make_reverse_table() {
    std::array<int, 256> t;
    t.fill(-1);
    for (int i = 0; i < 64; i++) {
        t[static_cast<unsigned char>(kTable[i])] = i;
    }
    return t;
}

} // anonymous namespace

std::string encode(const uint8_t* data, size_t len) {
    std::string ret;
    ret.reserve(((len + 2) / 3) * 4);
    uint32_t val = 0;
    int valb = -6;
    for (size_t i = 0; i < len; i++) {
        val = ((val << 8) + data[i]) & 0xFFFFFF;
        valb += 8;
        while (valb >= 0) {
            ret.push_back(kTable[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }
    if (valb > -6) ret.push_back(kTable[((val << 8) >> (valb + 8)) & 0x3F]);
    while (ret.size() % 4) ret.push_back('=');
    return ret;
}

ByteBuffer decode(const std::string& in) {
    static const std::array<int, 256> reverse = make_reverse_table();

    ByteBuffer out;
    out.reserve(in.size() * 3 / 4);
    uint32_t val = 0;
    int valb = -8;
    for (unsigned char c : in) {
        if (reverse[c] == -1) break;
        val = ((val << 6) + static_cast<uint32_t>(reverse[c])) & 0xFFFFFF;
        valb += 6;
        if (valb >= 0) {
            out.push_back(static_cast<uint8_t>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }
    return out;
}

} // namespace base64
} // namespace parley

/**
 * @file format_converter.cpp
 * @brief PCM container decode, downmix, bit depth conversion and resampling
 */

#include "audio/format_converter.h"
#include "errors.h"
#include "logger.h"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <sstream>

namespace parley {
namespace convert {

namespace {

constexpr uint16_t WAVE_FORMAT_PCM = 0x0001;
constexpr uint16_t WAVE_FORMAT_EXTENSIBLE = 0xFFFE;

uint16_t read_u16(const ByteBuffer& b, size_t offset) {
    return static_cast<uint16_t>(b[offset] | (b[offset + 1] << 8));
}

uint32_t read_u32(const ByteBuffer& b, size_t offset) {
    return static_cast<uint32_t>(b[offset]) |
           (static_cast<uint32_t>(b[offset + 1]) << 8) |
           (static_cast<uint32_t>(b[offset + 2]) << 16) |
           (static_cast<uint32_t>(b[offset + 3]) << 24);
}

bool tag_equals(const ByteBuffer& b, size_t offset, const char* tag) {
    return std::memcmp(b.data() + offset, tag, 4) == 0;
}

void check_channels(int channels) {
    if (channels != 1 && channels != 2) {
        throw MediaFormatError("unsupported channel count: " + std::to_string(channels) +
                               " (expected 1 or 2)");
    }
}

/// Read one sample of the given width and widen/narrow it to 16 bits
int32_t read_sample16(const uint8_t* p, int bytes_per_sample) {
    switch (bytes_per_sample) {
        case 1:
            // 8-bit WAV is unsigned with a 128 bias
            return (static_cast<int32_t>(p[0]) - 128) << 8;
        case 2:
            return static_cast<int16_t>(static_cast<uint16_t>(p[0] | (p[1] << 8)));
        case 3:
            // Keep the two most significant bytes
            return static_cast<int16_t>(static_cast<uint16_t>(p[1] | (p[2] << 8)));
        case 4:
            return static_cast<int16_t>(static_cast<uint16_t>(p[2] | (p[3] << 8)));
        default:
            return 0;
    }
}

} // anonymous namespace

DecodedAudio decode_container(const ByteBuffer& bytes) {
    if (bytes.size() < 12 || !tag_equals(bytes, 0, "RIFF") || !tag_equals(bytes, 8, "WAVE")) {
        throw MediaFormatError("not a RIFF/WAVE container");
    }

    DecodedAudio out;
    bool have_fmt = false;
    size_t offset = 12;

    while (offset + 8 <= bytes.size()) {
        uint32_t chunk_size = read_u32(bytes, offset + 4);
        size_t body = offset + 8;
        size_t available = bytes.size() - body;

        if (tag_equals(bytes, offset, "fmt ")) {
            if (chunk_size < 16 || available < 16) {
                throw MediaFormatError("truncated fmt chunk");
            }
            uint16_t format = read_u16(bytes, body);
            if (format != WAVE_FORMAT_PCM && format != WAVE_FORMAT_EXTENSIBLE) {
                throw MediaFormatError("unsupported WAV encoding: " + std::to_string(format));
            }
            out.channels = read_u16(bytes, body + 2);
            out.sample_rate = static_cast<int>(read_u32(bytes, body + 4));
            out.bit_depth = read_u16(bytes, body + 14);
            have_fmt = true;
        } else if (tag_equals(bytes, offset, "data")) {
            if (!have_fmt) {
                throw MediaFormatError("data chunk before fmt chunk");
            }
            // Streaming writers leave the size at 0 or 0xFFFFFFFF; take what is there
            size_t size = std::min<size_t>(chunk_size, available);
            out.pcm.assign(bytes.begin() + static_cast<std::ptrdiff_t>(body),
                           bytes.begin() + static_cast<std::ptrdiff_t>(body + size));
            break;
        }

        // Chunks are word aligned
        size_t advance = 8 + static_cast<size_t>(chunk_size) + (chunk_size & 1u);
        if (advance > bytes.size() - offset) break;
        offset += advance;
    }

    if (!have_fmt) {
        throw MediaFormatError("missing fmt chunk");
    }
    check_channels(out.channels);
    if (out.bit_depth != 8 && out.bit_depth != 16 && out.bit_depth != 24 && out.bit_depth != 32) {
        throw MediaFormatError("unsupported bit depth: " + std::to_string(out.bit_depth));
    }
    if (out.sample_rate <= 0) {
        throw MediaFormatError("invalid sample rate");
    }

    size_t frame_bytes = static_cast<size_t>(out.channels) * static_cast<size_t>(out.bit_depth / 8);
    out.pcm.resize(out.pcm.size() - (out.pcm.size() % frame_bytes));
    if (out.frame_count() == 0) {
        throw MediaFormatError("container contained no audio");
    }

    std::ostringstream info;
    info << "Decoded WAV: " << out.sample_rate << "Hz, " << out.channels << "ch, "
         << out.bit_depth << "-bit, " << out.frame_count() << " frames";
    LOG_AUDIO(info.str());
    return out;
}

ByteBuffer to_mono16(const ByteBuffer& pcm, int channels, int bit_depth) {
    check_channels(channels);
    if (bit_depth != 8 && bit_depth != 16 && bit_depth != 24 && bit_depth != 32) {
        throw MediaFormatError("unsupported bit depth: " + std::to_string(bit_depth));
    }

    const int width = bit_depth / 8;
    const size_t frame_bytes = static_cast<size_t>(width) * static_cast<size_t>(channels);
    const size_t frames = pcm.size() / frame_bytes;

    ByteBuffer out(frames * audio::BYTES_PER_SAMPLE);
    for (size_t i = 0; i < frames; ++i) {
        const uint8_t* p = pcm.data() + i * frame_bytes;
        int32_t value = read_sample16(p, width);
        if (channels == 2) {
            int32_t right = read_sample16(p + width, width);
            value = (value + right) / 2;
        }
        uint16_t v = static_cast<uint16_t>(static_cast<int16_t>(value));
        out[2 * i] = static_cast<uint8_t>(v & 0xFF);
        out[2 * i + 1] = static_cast<uint8_t>(v >> 8);
    }
    return out;
}

PcmBuffer bytes_to_samples(const ByteBuffer& bytes) {
    PcmBuffer samples(bytes.size() / 2);
    for (size_t i = 0; i < samples.size(); ++i) {
        samples[i] = static_cast<Sample>(static_cast<uint16_t>(bytes[2 * i] | (bytes[2 * i + 1] << 8)));
    }
    return samples;
}

ByteBuffer samples_to_bytes(const PcmBuffer& samples) {
    ByteBuffer bytes(samples.size() * 2);
    for (size_t i = 0; i < samples.size(); ++i) {
        uint16_t v = static_cast<uint16_t>(samples[i]);
        bytes[2 * i] = static_cast<uint8_t>(v & 0xFF);
        bytes[2 * i + 1] = static_cast<uint8_t>(v >> 8);
    }
    return bytes;
}

PcmBuffer resample(const PcmBuffer& input, int src_rate, int dst_rate) {
    if (src_rate <= 0 || dst_rate <= 0) {
        throw MediaFormatError("invalid resample rates");
    }
    if (src_rate == dst_rate || input.empty()) return input;

    size_t output_samples = static_cast<size_t>(
        (static_cast<uint64_t>(input.size()) * static_cast<uint64_t>(dst_rate)) /
        static_cast<uint64_t>(src_rate));
    const double ratio = static_cast<double>(src_rate) / static_cast<double>(dst_rate);

    PcmBuffer output;
    output.reserve(output_samples);

    for (size_t i = 0; i < output_samples; i++) {
        double input_pos = static_cast<double>(i) * ratio;
        size_t idx0 = static_cast<size_t>(input_pos);
        if (idx0 >= input.size()) break;
        size_t idx1 = std::min(idx0 + 1, input.size() - 1);

        // Linear interpolation
        double t = input_pos - static_cast<double>(idx0);
        double interpolated = input[idx0] * (1.0 - t) + input[idx1] * t;
        output.push_back(static_cast<Sample>(std::lround(std::clamp(interpolated, -32768.0, 32767.0))));
    }
    return output;
}

ByteBuffer resample(const ByteBuffer& pcm16_mono, int src_rate, int dst_rate) {
    if (src_rate == dst_rate) {
        ByteBuffer aligned = pcm16_mono;
        aligned.resize(aligned.size() - (aligned.size() % 2));
        return aligned;
    }
    return samples_to_bytes(resample(bytes_to_samples(pcm16_mono), src_rate, dst_rate));
}

ByteBuffer decode_to_mono16(const ByteBuffer& container, int dst_rate) {
    DecodedAudio decoded = decode_container(container);
    ByteBuffer mono = to_mono16(decoded.pcm, decoded.channels, decoded.bit_depth);
    return resample(mono, decoded.sample_rate, dst_rate);
}

// =============================================================================
// StreamResampler
// =============================================================================

StreamResampler::StreamResampler(int src_rate, int dst_rate)
    : src_rate_(src_rate), dst_rate_(dst_rate) {
    if (src_rate <= 0 || dst_rate <= 0) {
        throw MediaFormatError("invalid resample rates");
    }
}

void StreamResampler::set_rates(int src_rate, int dst_rate) {
    if (src_rate <= 0 || dst_rate <= 0) {
        throw MediaFormatError("invalid resample rates");
    }
    if (src_rate == src_rate_ && dst_rate == dst_rate_) return;
    src_rate_ = src_rate;
    dst_rate_ = dst_rate;
    reset();
}

void StreamResampler::reset() {
    position_ = 0.0;
    last_ = 0;
}

PcmBuffer StreamResampler::process(const PcmBuffer& input) {
    if (src_rate_ == dst_rate_ || input.empty()) return input;

    const double step = static_cast<double>(src_rate_) / static_cast<double>(dst_rate_);
    const long size = static_cast<long>(input.size());

    PcmBuffer output;
    output.reserve(static_cast<size_t>(static_cast<double>(input.size()) / step) + 2);

    // Index -1 refers to the last sample of the previous chunk
    while (true) {
        long idx0 = static_cast<long>(std::floor(position_));
        if (idx0 + 1 >= size) break;
        double t = position_ - static_cast<double>(idx0);
        double s0 = idx0 < 0 ? static_cast<double>(last_) : static_cast<double>(input[static_cast<size_t>(idx0)]);
        double s1 = static_cast<double>(input[static_cast<size_t>(idx0 + 1)]);
        double value = s0 + (s1 - s0) * t;
        output.push_back(static_cast<Sample>(std::lround(std::clamp(value, -32768.0, 32767.0))));
        position_ += step;
    }

    position_ -= static_cast<double>(size);
    last_ = input.back();
    return output;
}

} // namespace convert
} // namespace parley

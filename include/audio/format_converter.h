#pragma once

/**
 * @file format_converter.h
 * @brief Raw PCM conversions: container decode, downmix, bit depth, resample
 *
 * Every function here is pure. Failures raise MediaFormatError so callers
 * can skip just the failing conversion.
 */

#include "core/types.h"
#include <string>

namespace parley {
namespace convert {

/**
 * @brief PCM payload extracted from a container
 */
struct DecodedAudio {
    ByteBuffer pcm;          ///< Interleaved little-endian samples, frame aligned
    int sample_rate = 0;
    int channels = 0;
    int bit_depth = 0;

    size_t frame_count() const {
        size_t frame_bytes = static_cast<size_t>(channels) * static_cast<size_t>(bit_depth / 8);
        return frame_bytes == 0 ? 0 : pcm.size() / frame_bytes;
    }
};

/**
 * @brief Decode a RIFF/WAVE container (integer PCM)
 * @throws MediaFormatError on malformed headers, unsupported encodings,
 *         channel counts other than 1 or 2, or zero audio frames
 */
DecodedAudio decode_container(const ByteBuffer& bytes);

/**
 * @brief Downmix and convert to 16-bit mono
 * @param pcm Interleaved samples; a trailing partial frame is truncated
 * @param channels 1 or 2
 * @param bit_depth 8 (unsigned), 16, 24 or 32 (signed)
 * @throws MediaFormatError for unsupported channel counts or bit depths
 */
ByteBuffer to_mono16(const ByteBuffer& pcm, int channels, int bit_depth);

/**
 * @brief Linear-interpolation resample of 16-bit mono PCM
 *
 * Output holds floor(input_samples * dst_rate / src_rate) samples so the
 * duration is preserved within one sample period.
 */
ByteBuffer resample(const ByteBuffer& pcm16_mono, int src_rate, int dst_rate);

PcmBuffer resample(const PcmBuffer& input, int src_rate, int dst_rate);

/// Little-endian bytes to samples; an odd trailing byte is dropped
PcmBuffer bytes_to_samples(const ByteBuffer& bytes);

ByteBuffer samples_to_bytes(const PcmBuffer& samples);

/**
 * @brief Decode + downmix + resample in one call
 */
ByteBuffer decode_to_mono16(const ByteBuffer& container, int dst_rate);

/**
 * @brief Resampler for a continuous stream delivered in chunks
 *
 * Carries the fractional read position and the last input sample across
 * calls, so chunk boundaries do not introduce discontinuities.
 */
class StreamResampler {
public:
    StreamResampler(int src_rate, int dst_rate);

    PcmBuffer process(const PcmBuffer& input);

    /// Change rates; resets stream state when they differ from the current ones
    void set_rates(int src_rate, int dst_rate);

    void reset();

    int src_rate() const { return src_rate_; }
    int dst_rate() const { return dst_rate_; }

private:
    int src_rate_;
    int dst_rate_;
    double position_ = 0.0;   ///< Next output position, relative to the next chunk start
    Sample last_ = 0;
};

} // namespace convert
} // namespace parley

#pragma once

/**
 * @file background_mixer.h
 * @brief Loops a background track under outgoing speech audio
 */

#include "core/frame.h"
#include "core/types.h"
#include <memory>
#include <string>

namespace parley {

/**
 * @brief Decoded background ambience, PCM16 mono at one sample rate
 *
 * The byte buffer is shared read-only between every session using the
 * same (source, sample rate); read cursors are per mixer.
 */
struct BackgroundTrack {
    std::shared_ptr<const ByteBuffer> pcm;
    int sample_rate = 0;
    std::string source;

    size_t size() const { return pcm ? pcm->size() : 0; }
    bool empty() const { return size() == 0; }
};

/**
 * @brief Copy n bytes from track into out, wrapping to 0 at the end
 * @param cursor Read position; advanced by n modulo track size
 *
 * out is resized to n, so reusing one buffer avoids reallocating per frame.
 */
void read_cyclic(const ByteBuffer& track, size_t& cursor, size_t n, ByteBuffer& out);

/**
 * @brief Add gain-scaled background bytes to speech bytes, saturating at int16 limits
 *
 * Both buffers hold little-endian PCM16; speech keeps its length.
 */
void mix_pcm16(ByteBuffer& speech, const ByteBuffer& background, float gain);

/**
 * @brief Per-session mixer state over a shared track
 */
class BackgroundMixer {
public:
    BackgroundMixer(BackgroundTrack track, float gain);

    /**
     * @brief Mix the next stretch of background into a frame in place
     * @return True if the frame was mixed, false if it passed through untouched
     *
     * A frame that cannot be mixed (rate or channel mismatch) is passed
     * through and the mixer disables itself for the rest of the session.
     */
    bool mix(AudioData& frame);

    size_t cursor() const { return cursor_; }
    float gain() const { return gain_; }
    bool enabled() const { return enabled_; }
    const BackgroundTrack& track() const { return track_; }

private:
    BackgroundTrack track_;
    float gain_;
    size_t cursor_ = 0;
    bool enabled_ = true;
    ByteBuffer scratch_;
};

} // namespace parley

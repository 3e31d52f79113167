/**
 * @file background_mixer.cpp
 * @brief Cyclic background read and saturating PCM16 mix
 */

#include "audio/background_mixer.h"
#include "errors.h"
#include "logger.h"
#include <algorithm>
#include <cstring>

namespace parley {

void read_cyclic(const ByteBuffer& track, size_t& cursor, size_t n, ByteBuffer& out) {
    out.resize(n);
    const size_t length = track.size();
    if (length == 0 || n == 0) {
        std::fill(out.begin(), out.end(), 0);
        return;
    }

    cursor %= length;
    size_t written = 0;
    while (written < n) {
        size_t chunk = std::min(n - written, length - cursor);
        std::memcpy(out.data() + written, track.data() + cursor, chunk);
        written += chunk;
        cursor += chunk;
        if (cursor == length) {
            cursor = 0;
        }
    }
}

void mix_pcm16(ByteBuffer& speech, const ByteBuffer& background, float gain) {
    const size_t samples = std::min(speech.size(), background.size()) / 2;
    for (size_t i = 0; i < samples; ++i) {
        int32_t s = static_cast<int16_t>(static_cast<uint16_t>(speech[2 * i] | (speech[2 * i + 1] << 8)));
        int32_t b = static_cast<int16_t>(static_cast<uint16_t>(background[2 * i] | (background[2 * i + 1] << 8)));

        // Scale then add, both clipped to the int16 range
        float scaled = std::clamp(static_cast<float>(b) * gain, -32768.0f, 32767.0f);
        int32_t mixed = std::clamp(s + static_cast<int32_t>(scaled), -32768, 32767);

        uint16_t v = static_cast<uint16_t>(static_cast<int16_t>(mixed));
        speech[2 * i] = static_cast<uint8_t>(v & 0xFF);
        speech[2 * i + 1] = static_cast<uint8_t>(v >> 8);
    }
}

BackgroundMixer::BackgroundMixer(BackgroundTrack track, float gain)
    : track_(std::move(track)), gain_(gain) {
    if (track_.empty() || gain_ <= 0.0f) {
        enabled_ = false;
    }
}

bool BackgroundMixer::mix(AudioData& frame) {
    if (!enabled_ || frame.bytes.empty()) {
        return false;
    }

    try {
        if (frame.channels != 1) {
            throw MediaFormatError("background mixing needs mono speech, got " +
                                   std::to_string(frame.channels) + " channels");
        }
        if (frame.sample_rate != track_.sample_rate) {
            throw MediaFormatError("speech rate " + std::to_string(frame.sample_rate) +
                                   "Hz does not match background rate " +
                                   std::to_string(track_.sample_rate) + "Hz");
        }

        read_cyclic(*track_.pcm, cursor_, frame.bytes.size(), scratch_);
        mix_pcm16(frame.bytes, scratch_, gain_);
        return true;
    } catch (const MediaFormatError& e) {
        LOG_WARN(std::string("Background mixing disabled: ") + e.what());
        enabled_ = false;
        return false;
    }
}

} // namespace parley

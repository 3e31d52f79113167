#pragma once

/**
 * @file energy_vad.h
 * @brief Energy-based Voice Activity Detection
 *
 * Features:
 * - Pre-speech buffer to capture word beginnings
 * - Adaptive threshold based on noise floor
 * - Hysteresis to prevent oscillation
 * - Forced end of utterance after max_speech_ms
 */

#include "vad_interface.h"
#include "core/constants.h"
#include <memory>

namespace parley {
namespace vad {

/**
 * @brief Configuration for energy-based VAD
 */
struct EnergyVADConfig {
    int sample_rate = audio::SAMPLE_RATE;

    /// Base threshold (used if adaptive disabled, or as minimum)
    float threshold = constants::vad::DEFAULT_THRESHOLD;

    /// Minimum speech duration to be valid (ms)
    int min_speech_ms = constants::vad::MIN_SPEECH_MS;

    /// Silence duration to end utterance (ms)
    int end_silence_ms = constants::vad::END_SILENCE_MS;

    /// Pre-speech buffer duration (ms)
    int pre_speech_ms = constants::vad::PRE_SPEECH_MS;

    /// Utterances longer than this are cut (ms)
    int max_speech_ms = constants::vad::MAX_SPEECH_MS;

    /// Enable adaptive threshold based on noise floor
    bool adaptive_threshold = true;
};

/**
 * @brief Energy-based VAD implementation
 *
 * Uses RMS energy with adaptive thresholding and pre-speech buffering.
 */
class EnergyVAD : public IVAD {
public:
    explicit EnergyVAD(const EnergyVADConfig& config = {});
    ~EnergyVAD() override;

    Event process(const PcmBuffer& frame) override;
    PcmBuffer finalize_segment() override;
    void reset() override;
    Stats get_stats() const override;
    bool is_speech() const override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace vad
} // namespace parley

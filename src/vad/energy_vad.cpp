/**
 * @file energy_vad.cpp
 * @brief Energy-based VAD implementation
 */

#include "vad/energy_vad.h"
#include "logger.h"
#include <algorithm>
#include <cmath>
#include <deque>
#include <sstream>

namespace parley {
namespace vad {

class EnergyVAD::Impl {
public:
    explicit Impl(const EnergyVADConfig& config)
        : config_(config)
        , state_(State::Silence)
        , speech_samples_(0)
        , silence_samples_(0)
        , consecutive_speech_frames_(0)
        , noise_floor_(config.threshold)
        , current_rms_(0.0f)
    {
        int rate = config.sample_rate > 0 ? config.sample_rate : audio::SAMPLE_RATE;
        pre_speech_capacity_ = audio::ms_to_samples(config.pre_speech_ms, rate);
        min_speech_samples_ = audio::ms_to_samples(config.min_speech_ms, rate);
        end_silence_samples_ = audio::ms_to_samples(config.end_silence_ms, rate);
        max_speech_samples_ = audio::ms_to_samples(config.max_speech_ms, rate);
        sample_rate_ = rate;

        std::ostringstream oss;
        oss << "[VAD] threshold=" << config.threshold
            << ", min_speech=" << config.min_speech_ms << "ms"
            << ", end_silence=" << config.end_silence_ms << "ms"
            << ", pre_buffer=" << config.pre_speech_ms << "ms"
            << ", adaptive=" << (config.adaptive_threshold ? "on" : "off");
        LOG_DEBUG(oss.str());
    }

    Event process(const PcmBuffer& frame) {
        current_rms_ = compute_rms(frame);

        if (config_.adaptive_threshold) {
            update_noise_floor(current_rms_);
        }

        float effective_start = get_effective_threshold();
        float effective_end = effective_start * constants::vad::HYSTERESIS_RATIO;

        Event event = Event::None;
        if (state_ == State::Silence) {
            event = process_silence_state(frame, current_rms_ > effective_start);
        } else {
            event = process_speech_state(frame, current_rms_ > effective_end);
        }

        // Rolling window of recent audio; only read on the next SpeechStart
        if (state_ == State::Silence) {
            pre_speech_.insert(pre_speech_.end(), frame.begin(), frame.end());
            while (pre_speech_.size() > pre_speech_capacity_) {
                pre_speech_.pop_front();
            }
        }
        return event;
    }

    PcmBuffer finalize_segment() {
        PcmBuffer result = std::move(speech_buffer_);
        speech_buffer_.clear();
        return result;
    }

    void reset() {
        state_ = State::Silence;
        speech_samples_ = 0;
        silence_samples_ = 0;
        consecutive_speech_frames_ = 0;
        speech_buffer_.clear();
        // Noise floor persists across utterances
    }

    Stats get_stats() const {
        Stats stats;
        stats.state = state_;
        stats.current_rms = current_rms_;
        stats.noise_floor = noise_floor_;
        stats.threshold = get_effective_threshold();
        stats.speech_duration_ms = audio::samples_to_ms(speech_samples_, sample_rate_);
        stats.silence_duration_ms = audio::samples_to_ms(silence_samples_, sample_rate_);
        stats.pre_buffer_samples = pre_speech_.size();
        return stats;
    }

    bool is_speech() const {
        return state_ == State::Speech;
    }

private:
    // =========================================================================
    // State Processing
    // =========================================================================

    Event process_silence_state(const PcmBuffer& frame, bool above_start) {
        if (!above_start) {
            consecutive_speech_frames_ = 0;
            return Event::None;
        }

        consecutive_speech_frames_++;
        if (consecutive_speech_frames_ < constants::vad::DEBOUNCE_FRAMES) {
            return Event::None;
        }

        state_ = State::Speech;
        speech_samples_ = frame.size();
        silence_samples_ = 0;
        consecutive_speech_frames_ = 0;

        speech_buffer_.assign(pre_speech_.begin(), pre_speech_.end());
        speech_buffer_.insert(speech_buffer_.end(), frame.begin(), frame.end());
        pre_speech_.clear();

        log_state_transition("SpeechStart");
        return Event::SpeechStart;
    }

    Event process_speech_state(const PcmBuffer& frame, bool above_end) {
        speech_buffer_.insert(speech_buffer_.end(), frame.begin(), frame.end());

        if (above_end) {
            speech_samples_ += frame.size();
            silence_samples_ = 0;
        } else {
            silence_samples_ += frame.size();
        }

        bool too_long = max_speech_samples_ > 0 && speech_buffer_.size() >= max_speech_samples_;
        if (silence_samples_ < end_silence_samples_ && !too_long) {
            return Event::None;
        }

        if (speech_samples_ < min_speech_samples_) {
            LOG_DEBUG("[VAD] Speech too short, discarding");
            reset();
            return Event::None;
        }

        log_state_transition(too_long ? "SpeechEnd (max length)" : "SpeechEnd");
        state_ = State::Silence;
        speech_samples_ = 0;
        silence_samples_ = 0;
        return Event::SpeechEnd;
    }

    // =========================================================================
    // Signal Processing
    // =========================================================================

    float compute_rms(const PcmBuffer& frame) const {
        if (frame.empty()) return 0.0f;

        double sum_sq = 0.0;
        for (Sample s : frame) {
            double normalized = static_cast<double>(s) / 32768.0;
            sum_sq += normalized * normalized;
        }
        return static_cast<float>(std::sqrt(sum_sq / frame.size()));
    }

    void update_noise_floor(float rms) {
        // Speech must not contaminate the noise estimate
        if (state_ != State::Silence) return;

        constexpr float NOISE_FLOOR_ALPHA = 0.01f;

        if (rms < noise_floor_ * 2.0f) {
            noise_floor_ = noise_floor_ * (1.0f - NOISE_FLOOR_ALPHA) + rms * NOISE_FLOOR_ALPHA;
            noise_floor_ = std::clamp(
                noise_floor_,
                constants::vad::MIN_ADAPTIVE_THRESHOLD / constants::vad::ADAPTIVE_THRESHOLD_MULTIPLIER,
                constants::vad::MAX_ADAPTIVE_THRESHOLD / constants::vad::ADAPTIVE_THRESHOLD_MULTIPLIER
            );
        }
    }

    float get_effective_threshold() const {
        if (!config_.adaptive_threshold) {
            return config_.threshold;
        }

        float adaptive = noise_floor_ * constants::vad::ADAPTIVE_THRESHOLD_MULTIPLIER;
        return std::clamp(
            adaptive,
            constants::vad::MIN_ADAPTIVE_THRESHOLD,
            std::max(config_.threshold, constants::vad::MAX_ADAPTIVE_THRESHOLD)
        );
    }

    void log_state_transition(const char* event) const {
        std::ostringstream oss;
        oss << "[VAD] " << event
            << " rms=" << current_rms_
            << " threshold=" << get_effective_threshold()
            << " speech_ms=" << audio::samples_to_ms(speech_samples_, sample_rate_);
        LOG_DEBUG(oss.str());
    }

    EnergyVADConfig config_;
    State state_;
    int sample_rate_ = audio::SAMPLE_RATE;

    std::deque<Sample> pre_speech_;
    size_t pre_speech_capacity_ = 0;
    PcmBuffer speech_buffer_;

    size_t speech_samples_;
    size_t silence_samples_;
    int consecutive_speech_frames_;

    size_t min_speech_samples_ = 0;
    size_t end_silence_samples_ = 0;
    size_t max_speech_samples_ = 0;

    float noise_floor_;
    float current_rms_;
};

// =============================================================================
// Public Interface Implementation
// =============================================================================

EnergyVAD::EnergyVAD(const EnergyVADConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

EnergyVAD::~EnergyVAD() = default;

Event EnergyVAD::process(const PcmBuffer& frame) {
    return impl_->process(frame);
}

PcmBuffer EnergyVAD::finalize_segment() {
    return impl_->finalize_segment();
}

void EnergyVAD::reset() {
    impl_->reset();
}

Stats EnergyVAD::get_stats() const {
    return impl_->get_stats();
}

bool EnergyVAD::is_speech() const {
    return impl_->is_speech();
}

} // namespace vad
} // namespace parley

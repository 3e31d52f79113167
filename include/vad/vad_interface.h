#pragma once

/**
 * @file vad_interface.h
 * @brief Voice Activity Detection interface
 *
 * The recognition adapter segments the participant's audio with a VAD
 * before handing complete utterances to the recognizer.
 */

#include "core/types.h"
#include <memory>

namespace parley {
namespace vad {

/**
 * @brief VAD events emitted during processing
 */
enum class Event {
    None,           ///< No significant event
    SpeechStart,    ///< Speech detected (transition from silence)
    SpeechEnd       ///< Utterance complete; call finalize_segment()
};

enum class State {
    Silence,
    Speech
};

/**
 * @brief VAD statistics for debugging
 */
struct Stats {
    State state = State::Silence;
    float current_rms = 0.0f;
    float noise_floor = 0.0f;
    float threshold = 0.0f;
    int64_t speech_duration_ms = 0;
    int64_t silence_duration_ms = 0;
    size_t pre_buffer_samples = 0;
};

/**
 * @brief Abstract VAD interface
 */
class IVAD {
public:
    virtual ~IVAD() = default;

    /**
     * @brief Process a single audio frame
     * @return Event indicating state change (if any)
     */
    virtual Event process(const PcmBuffer& frame) = 0;

    /**
     * @brief Return the complete utterance and clear internal buffers
     *
     * Includes the pre-speech buffer so word beginnings are kept.
     */
    virtual PcmBuffer finalize_segment() = 0;

    /// Abort the current detection
    virtual void reset() = 0;

    virtual Stats get_stats() const = 0;

    virtual bool is_speech() const = 0;
};

inline const char* event_to_string(Event event) {
    switch (event) {
        case Event::None: return "None";
        case Event::SpeechStart: return "SpeechStart";
        case Event::SpeechEnd: return "SpeechEnd";
    }
    return "Unknown";
}

inline const char* state_to_string(State state) {
    switch (state) {
        case State::Silence: return "Silence";
        case State::Speech: return "Speech";
    }
    return "Unknown";
}

} // namespace vad
} // namespace parley

#pragma once

/**
 * @file speech_recognizer.h
 * @brief Streaming speech recognition interface
 */

#include "core/frame.h"
#include <functional>
#include <string>

namespace parley {
namespace stt {

struct RecognitionEvent {
    enum class Kind {
        SpeechStarted,   ///< Participant began speaking (barge-in trigger)
        Final            ///< Complete utterance transcript
    };

    Kind kind = Kind::Final;
    std::string text;
    float confidence = 0.0f;
};

using EventCallback = std::function<void(const RecognitionEvent& event)>;

/**
 * @brief Abstract recognizer
 *
 * Events may be delivered from an internal worker thread.
 */
class ISpeechRecognizer {
public:
    virtual ~ISpeechRecognizer() = default;

    /// Load models and begin accepting audio; throws ConfigurationError
    virtual void start(EventCallback on_event) = 0;

    /// Feed one captured audio frame
    virtual void submit(const AudioData& audio) = 0;

    /// Finish queued work and stop delivering events
    virtual void stop() = 0;

    virtual bool is_ready() const = 0;
};

} // namespace stt
} // namespace parley

#pragma once

/**
 * @file speech_synthesizer.h
 * @brief Streaming text-to-speech interface
 */

#include "core/frame.h"
#include "net/connection.h"
#include <functional>
#include <string>

namespace parley {
namespace tts {

/// Receives synthesized PCM16 mono audio as it streams in
using AudioCallback = std::function<void(const AudioData& chunk)>;

/**
 * @brief Abstract streaming synthesizer
 *
 * Exposes the Connectable state so a ResilientConnection can guard it.
 */
class ISpeechSynthesizer : public Connectable {
public:
    ~ISpeechSynthesizer() override = default;

    /**
     * @brief Synthesize text, blocking until the last chunk or cancel()
     * @throws ConnectionError if the connection drops, UpstreamServiceError on service errors
     */
    virtual void speak(const std::string& text, const AudioCallback& on_audio) = 0;

    /// Stop the utterance in progress; speak() returns promptly (thread-safe)
    virtual void cancel() = 0;

    /// Close the connection
    virtual void close() = 0;

    virtual int sample_rate() const = 0;
};

} // namespace tts
} // namespace parley

#pragma once

#include "net/resilient_connection.h"
#include "pipeline/stage.h"
#include "text/text_flush_buffer.h"
#include "tts/speech_synthesizer.h"
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace parley {
namespace stages {

/**
 * @brief Speaks response text and emits the synthesized audio
 *
 * Tokens collect in a TextFlushBuffer; each released chunk is stripped of
 * markdown and spoken through the synthesizer, guarded by a
 * ResilientConnection. Text frames are forwarded unchanged so later
 * stages can aggregate them.
 *
 * A chunk that still fails after one reconnect ends the session: the
 * stage stops speaking and sends a fatal Error frame once the current
 * turn has closed (after ResponseEnd or Interruption, before End).
 *
 * With a bypass predicate set, text is only forwarded while the predicate
 * holds (a text-driven avatar is speaking it instead).
 */
class SynthesisStage : public pipeline::Stage {
public:
    using Bypass = std::function<bool()>;

    SynthesisStage(std::shared_ptr<tts::ISpeechSynthesizer> synthesizer,
                   BackoffPolicy backoff,
                   Bypass bypass = nullptr);

    /// Inject sleeping/jitter into the connection guard (tests)
    SynthesisStage(std::shared_ptr<tts::ISpeechSynthesizer> synthesizer,
                   std::unique_ptr<ResilientConnection> connection,
                   Bypass bypass = nullptr);

    void process(Frame frame, Direction direction) override;
    void interrupt() override;
    void cancel() override;
    void cleanup() override;

    int spoken_chunks() const { return spoken_chunks_.load(); }

private:
    void speak(const std::string& chunk);
    void speak_or_fail(const std::string& chunk);
    void report_failure();
    bool bypassed() const { return bypass_ && bypass_(); }

    std::shared_ptr<tts::ISpeechSynthesizer> synthesizer_;
    std::unique_ptr<ResilientConnection> connection_;
    Bypass bypass_;
    TextFlushBuffer buffer_;

    std::atomic<uint64_t> generation_{0};
    std::atomic<int> spoken_chunks_{0};

    /// Set once a chunk fails after its reconnect; reported when the turn closes
    std::optional<Error> failure_;
    bool failure_reported_ = false;
};

} // namespace stages
} // namespace parley

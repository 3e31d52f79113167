#include "stages/synthesis_stage.h"
#include "errors.h"
#include "logger.h"
#include "text/markdown_filter.h"
#include "utils.h"

namespace parley {
namespace stages {

SynthesisStage::SynthesisStage(std::shared_ptr<tts::ISpeechSynthesizer> synthesizer,
                               BackoffPolicy backoff,
                               Bypass bypass)
    : Stage("synthesis")
    , synthesizer_(std::move(synthesizer))
    , connection_(std::make_unique<ResilientConnection>(*synthesizer_, backoff))
    , bypass_(std::move(bypass)) {}

SynthesisStage::SynthesisStage(std::shared_ptr<tts::ISpeechSynthesizer> synthesizer,
                               std::unique_ptr<ResilientConnection> connection,
                               Bypass bypass)
    : Stage("synthesis")
    , synthesizer_(std::move(synthesizer))
    , connection_(std::move(connection))
    , bypass_(std::move(bypass)) {}

void SynthesisStage::process(Frame frame, Direction direction) {
    if (direction != Direction::Downstream) {
        push_frame(std::move(frame), direction);
        return;
    }

    if (frame.is_control(ControlKind::Start)) {
        // A dead synthesizer at session start ends the session
        connection_->ensure_connected();
        push_frame(std::move(frame));
        return;
    }

    if (frame.is_text() && !frame.as_text().final) {
        std::string token = frame.as_text().text;
        push_frame(std::move(frame));
        if (bypassed()) {
            buffer_.clear();
            return;
        }
        if (auto chunk = buffer_.append(token)) {
            speak_or_fail(*chunk);
        }
        return;
    }

    if (frame.is_control(ControlKind::ResponseEnd)) {
        std::optional<std::string> rest = buffer_.flush();
        if (rest && !bypassed()) {
            speak_or_fail(*rest);
        }
        // The turn closes downstream before the session is failed
        push_frame(std::move(frame));
        report_failure();
        return;
    }

    if (frame.is_control(ControlKind::End)) {
        // Fail before End reaches the output, or the run would complete
        report_failure();
        push_frame(std::move(frame));
        return;
    }

    const bool interruption = frame.is_control(ControlKind::Interruption);
    if (interruption || frame.is_control(ControlKind::ResponseStart)) {
        buffer_.clear();
    }
    push_frame(std::move(frame));
    if (interruption) {
        report_failure();
    }
}

void SynthesisStage::interrupt() {
    generation_++;
    synthesizer_->cancel();
}

void SynthesisStage::cancel() {
    generation_++;
    connection_->cancel();
    synthesizer_->cancel();
}

void SynthesisStage::cleanup() {
    synthesizer_->close();
}

void SynthesisStage::speak_or_fail(const std::string& chunk) {
    if (failure_) return;
    try {
        speak(chunk);
    } catch (const ConnectionError& e) {
        LOG_ERROR(std::string("Synthesis unavailable: ") + e.what());
        failure_ = Error(ErrorType::Connection, std::string("synthesis: ") + e.what());
        buffer_.clear();
    }
}

void SynthesisStage::report_failure() {
    if (!failure_ || failure_reported_) return;
    failure_reported_ = true;
    push_frame(Frame::error(*failure_, true));
}

void SynthesisStage::speak(const std::string& chunk) {
    std::string text = strip_markdown(chunk);
    if (utils::is_empty_or_whitespace(text)) {
        return;
    }

    const uint64_t generation = generation_.load();
    auto on_audio = [this, generation](const AudioData& audio) {
        if (generation_.load() != generation) return;
        push_frame(Frame::audio(audio.bytes, audio.sample_rate, audio.channels));
    };

    connection_->ensure_connected();
    try {
        synthesizer_->speak(text, on_audio);
    } catch (const ConnectionError& e) {
        if (generation_.load() != generation) return;
        // Reconnect once and retry this chunk; a second failure propagates
        LOG_TTS(std::string("Connection lost mid-utterance: ") + e.what());
        connection_->ensure_connected();
        synthesizer_->speak(text, on_audio);
    }
    spoken_chunks_++;
}

} // namespace stages
} // namespace parley

#include "stages/recognition_stage.h"
#include "logger.h"

namespace parley {
namespace stages {

RecognitionStage::RecognitionStage(std::shared_ptr<stt::ISpeechRecognizer> recognizer)
    : Stage("recognition")
    , recognizer_(std::move(recognizer)) {}

void RecognitionStage::process(Frame frame, Direction direction) {
    if (direction == Direction::Downstream) {
        if (frame.is_audio()) {
            if (started_) {
                recognizer_->submit(frame.as_audio());
            }
            return;
        }
        if (frame.is_control(ControlKind::Start)) {
            recognizer_->start([this](const stt::RecognitionEvent& event) { on_event(event); });
            started_ = true;
        } else if (frame.is_control(ControlKind::End) && started_) {
            // Deliver the last transcript ahead of End
            recognizer_->stop();
            started_ = false;
        }
    }
    push_frame(std::move(frame), direction);
}

void RecognitionStage::cleanup() {
    recognizer_->stop();
}

void RecognitionStage::on_event(const stt::RecognitionEvent& event) {
    switch (event.kind) {
        case stt::RecognitionEvent::Kind::SpeechStarted:
            LOG_STT("Speech started, interrupting");
            push_frame(Frame::control(ControlKind::Interruption));
            break;
        case stt::RecognitionEvent::Kind::Final:
            LOG_STT("Transcript: " + event.text);
            push_frame(Frame::text(event.text, true));
            break;
    }
}

} // namespace stages
} // namespace parley

#pragma once

#include "pipeline/stage.h"
#include "stt/speech_recognizer.h"
#include <memory>

namespace parley {
namespace stages {

/**
 * @brief Feeds captured audio to the recognizer and emits its events
 *
 * Audio stops here. SpeechStarted becomes an Interruption; a final
 * transcript becomes a final Text frame, which survives interruption
 * purges.
 */
class RecognitionStage : public pipeline::Stage {
public:
    explicit RecognitionStage(std::shared_ptr<stt::ISpeechRecognizer> recognizer);

    void process(Frame frame, Direction direction) override;
    void cleanup() override;

private:
    void on_event(const stt::RecognitionEvent& event);

    std::shared_ptr<stt::ISpeechRecognizer> recognizer_;
    bool started_ = false;
};

} // namespace stages
} // namespace parley

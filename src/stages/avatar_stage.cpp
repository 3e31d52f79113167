#include "stages/avatar_stage.h"
#include "logger.h"

namespace parley {
namespace stages {

AvatarStage::AvatarStage(std::shared_ptr<AvatarFallbackController> controller)
    : Stage("avatar")
    , controller_(std::move(controller)) {}

void AvatarStage::process(Frame frame, Direction direction) {
    if (direction != Direction::Downstream) {
        push_frame(std::move(frame), direction);
        return;
    }

    switch (frame.type()) {
        case FrameType::Audio:
            if (controller_->mode() == AvatarMode::Audio && controller_->handle_audio(frame.as_audio())) {
                return;
            }
            break;
        case FrameType::Text:
            if (!frame.as_text().final) {
                controller_->handle_text(frame.as_text().text);
            }
            break;
        case FrameType::Image:
            controller_->handle_participant_image(frame.as_image());
            return;
        case FrameType::Control:
            if (frame.is_control(ControlKind::Start)) {
                push_frame(std::move(frame));
                bool active = controller_->start([this](Frame produced) {
                    return push_frame(std::move(produced));
                });
                LOG_AVATAR(std::string("Session starts ") + (active ? "with avatar" : "audio-only"));
                return;
            } else if (frame.is_control(ControlKind::ResponseEnd)) {
                controller_->end_of_turn();
            }
            break;
    }
    push_frame(std::move(frame));
}

void AvatarStage::interrupt() {
    controller_->interrupt();
}

void AvatarStage::cancel() {
    controller_->close();
}

void AvatarStage::cleanup() {
    controller_->shutdown();
}

} // namespace stages
} // namespace parley

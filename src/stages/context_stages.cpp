#include "stages/context_stages.h"
#include "logger.h"
#include "utils.h"

namespace parley {
namespace stages {

// =============================================================================
// UserContextStage
// =============================================================================

UserContextStage::UserContextStage(memory::ConversationContext& context, std::string greeting)
    : Stage("user-context")
    , context_(context)
    , greeting_(std::move(greeting)) {}

void UserContextStage::process(Frame frame, Direction direction) {
    if (direction != Direction::Downstream) {
        push_frame(std::move(frame), direction);
        return;
    }

    if (frame.is_text() && frame.as_text().final) {
        if (utils::is_empty_or_whitespace(frame.as_text().text)) {
            return;
        }
        if (context_.add_user_turn(frame.as_text().text)) {
            LOG_CTX("User turn carries a snapshot");
        }
        push_frame(Frame::control(ControlKind::TurnReady));
        return;
    }

    bool ready = frame.is_control(ControlKind::TransportReady);
    push_frame(std::move(frame));

    if (ready && !greeted_ && !greeting_.empty()) {
        greeted_ = true;
        LOG_CTX("Sending greeting");
        push_frame(Frame::control(ControlKind::ResponseStart));
        push_frame(Frame::text(greeting_, false));
        push_frame(Frame::control(ControlKind::ResponseEnd));
    }
}

// =============================================================================
// AssistantContextStage
// =============================================================================

AssistantContextStage::AssistantContextStage(memory::ConversationContext& context)
    : Stage("assistant-context")
    , context_(context) {}

void AssistantContextStage::process(Frame frame, Direction direction) {
    if (direction == Direction::Downstream) {
        if (frame.is_control(ControlKind::ResponseStart)) {
            pending_.clear();
            in_response_ = true;
        } else if (frame.is_text() && !frame.as_text().final) {
            pending_ += frame.as_text().text;
        } else if (frame.is_control(ControlKind::ResponseEnd)) {
            commit("complete");
        } else if (frame.is_control(ControlKind::Interruption)) {
            commit("interrupted");
        } else if (frame.is_control(ControlKind::End)) {
            commit("session end");
        }
    }
    push_frame(std::move(frame), direction);
}

void AssistantContextStage::commit(const char* reason) {
    std::string text = pending_;
    utils::trim(text);
    bool had_response = in_response_;
    pending_.clear();
    in_response_ = false;

    if (!had_response || text.empty()) {
        return;
    }
    context_.add_turn(MessageRole::Assistant, text);
    LOG_CTX(std::string("Assistant turn committed (") + reason + ")");
}

} // namespace stages
} // namespace parley

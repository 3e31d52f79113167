#pragma once

/**
 * @file context_stages.h
 * @brief Stages that write user and assistant turns into the conversation context
 */

#include "memory/conversation_context.h"
#include "pipeline/stage.h"
#include <string>

namespace parley {
namespace stages {

/**
 * @brief Commits final transcripts as user turns
 *
 * Each committed turn is announced downstream with TurnReady. On
 * TransportReady the configured greeting is sent as a bracketed response,
 * so it is spoken and recorded exactly like a model response.
 */
class UserContextStage : public pipeline::Stage {
public:
    UserContextStage(memory::ConversationContext& context, std::string greeting);

    void process(Frame frame, Direction direction) override;

private:
    memory::ConversationContext& context_;
    std::string greeting_;
    bool greeted_ = false;
};

/**
 * @brief Aggregates streamed response text into assistant turns
 *
 * Text between ResponseStart and ResponseEnd is committed at ResponseEnd.
 * On Interruption whatever arrived so far is committed, so the context
 * holds what the participant actually heard.
 */
class AssistantContextStage : public pipeline::Stage {
public:
    explicit AssistantContextStage(memory::ConversationContext& context);

    void process(Frame frame, Direction direction) override;

private:
    void commit(const char* reason);

    memory::ConversationContext& context_;
    std::string pending_;
    bool in_response_ = false;
};

} // namespace stages
} // namespace parley

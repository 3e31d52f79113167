#include "stages/llm_stage.h"
#include "errors.h"
#include "logger.h"

namespace parley {
namespace stages {

LlmStage::LlmStage(memory::ConversationContext& context,
                   std::shared_ptr<llm::ILanguageModel> model,
                   std::shared_ptr<IToolGateway> tools,
                   LlmStageOptions options)
    : Stage("llm")
    , context_(context)
    , model_(std::move(model))
    , tools_(std::move(tools))
    , options_(std::move(options)) {
    if (!tools_) {
        options_.tools_json.clear();
    }
}

void LlmStage::process(Frame frame, Direction direction) {
    if (direction == Direction::Downstream && frame.is_control(ControlKind::TurnReady)) {
        push_frame(std::move(frame));
        respond();
        return;
    }
    push_frame(std::move(frame), direction);
}

void LlmStage::interrupt() {
    generation_++;
    model_->abort();
}

void LlmStage::cancel() {
    generation_++;
    model_->abort();
}

void LlmStage::respond() {
    const uint64_t generation = generation_.load();
    auto on_token = [this, generation](const std::string& delta) {
        if (!delta.empty() && current(generation)) {
            push_frame(Frame::text(delta, false));
        }
    };

    push_frame(Frame::control(ControlKind::ResponseStart));

    auto start = Clock::now();
    for (int round = 0; current(generation); ++round) {
        llm::Completion completion;
        try {
            completion = model_->complete(context_.snapshot(), options_.tools_json, on_token);
        } catch (const UpstreamServiceError&) {
            // Close the bracket so downstream buffers settle, then report
            push_frame(Frame::control(ControlKind::ResponseEnd));
            throw;
        }

        if (completion.aborted || !current(generation)) {
            LOG_LLM("Response interrupted after " + std::to_string(ms_since(start)) + " ms");
            return;
        }

        if (!completion.has_tool_calls() || !tools_) {
            break;
        }
        if (round >= options_.max_tool_rounds) {
            LOG_WARN("Tool round limit reached (" + std::to_string(options_.max_tool_rounds) + ")");
            break;
        }

        context_.add_assistant_tool_calls(completion.content,
                                          llm::tool_calls_to_json(completion.tool_calls));
        for (const auto& call : completion.tool_calls) {
            if (!current(generation)) return;
            context_.add_tool_result(call.id, tools_->execute(call));
        }
    }

    if (!current(generation)) {
        return;
    }
    push_frame(Frame::control(ControlKind::ResponseEnd));
    completed_turns_++;
    LOG_LLM("Response complete in " + std::to_string(ms_since(start)) + " ms");
}

} // namespace stages
} // namespace parley

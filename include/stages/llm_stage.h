#pragma once

#include "llm/language_model.h"
#include "memory/conversation_context.h"
#include "pipeline/stage.h"
#include "tools/tool_gateway.h"
#include <atomic>
#include <memory>
#include <string>

namespace parley {
namespace stages {

struct LlmStageOptions {
    std::string tools_json;     ///< Tool schemas; empty disables tool calling
    int max_tool_rounds = 4;
};

/**
 * @brief Runs one streamed completion per committed user turn
 *
 * Output per turn: ResponseStart, non-final Text tokens, ResponseEnd.
 * Tool calls go through the gateway and the completion is re-run with
 * the results, bounded by max_tool_rounds. An interrupted turn stops
 * emitting immediately and sends no ResponseEnd.
 */
class LlmStage : public pipeline::Stage {
public:
    LlmStage(memory::ConversationContext& context,
             std::shared_ptr<llm::ILanguageModel> model,
             std::shared_ptr<IToolGateway> tools,
             LlmStageOptions options);

    void process(Frame frame, Direction direction) override;
    void interrupt() override;
    void cancel() override;

    int completed_turns() const { return completed_turns_.load(); }

private:
    void respond();
    bool current(uint64_t generation) const { return generation_.load() == generation; }

    memory::ConversationContext& context_;
    std::shared_ptr<llm::ILanguageModel> model_;
    std::shared_ptr<IToolGateway> tools_;
    LlmStageOptions options_;

    std::atomic<uint64_t> generation_{0};
    std::atomic<int> completed_turns_{0};
};

} // namespace stages
} // namespace parley

#pragma once

/**
 * @file language_model.h
 * @brief Streaming chat-completion interface
 */

#include "memory/conversation_context.h"
#include <functional>
#include <string>
#include <vector>

namespace parley {
namespace llm {

/**
 * @brief Tool call requested by the model
 */
struct ToolCall {
    std::string id;           // Tool call ID from the model
    std::string name;         // Tool name
    std::string arguments;    // JSON string of arguments
};

/**
 * @brief Result of one streamed completion
 */
struct Completion {
    std::string content;                // Full text streamed to on_token
    std::vector<ToolCall> tool_calls;
    std::string finish_reason;
    bool aborted = false;               // abort() cut the stream short

    bool has_tool_calls() const { return !tool_calls.empty(); }
};

/// Called with each streamed text fragment
using TokenCallback = std::function<void(const std::string& delta)>;

/**
 * @brief Abstract language model
 */
class ILanguageModel {
public:
    virtual ~ILanguageModel() = default;

    /**
     * @brief Stream a completion for the given context
     * @param messages Read-only snapshot of the conversation
     * @param tools_json JSON array of tool schemas (empty = no tools)
     * @throws UpstreamServiceError on transport or HTTP failures
     */
    virtual Completion complete(const std::vector<memory::ContextMessage>& messages,
                                const std::string& tools_json,
                                const TokenCallback& on_token) = 0;

    /// Abort the in-flight completion, if any (thread-safe)
    virtual void abort() = 0;
};

/// Assistant tool_calls array in OpenAI message format
std::string tool_calls_to_json(const std::vector<ToolCall>& calls);

} // namespace llm
} // namespace parley

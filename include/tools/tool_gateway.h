#pragma once

/**
 * @file tool_gateway.h
 * @brief Executes model tool calls through an external HTTP gateway
 */

#include "llm/language_model.h"
#include <string>

namespace parley {

/**
 * @brief Tool execution gateway
 *
 * execute() never throws: transport failures, timeouts and malformed
 * responses come back as {"success": false, "message": ...} so the model
 * sees the failure as an ordinary tool result.
 */
class IToolGateway {
public:
    virtual ~IToolGateway() = default;

    /**
     * @brief Run one tool call
     * @return JSON text handed back to the model as the tool result
     */
    virtual std::string execute(const llm::ToolCall& call) = 0;
};

struct ToolGatewayConfig {
    std::string url;
    std::string api_key;
    long timeout_ms = 15000;
    std::string call_id;    ///< Forwarded with every request
};

/**
 * @brief POSTs {"name","arguments","call_id"} to the gateway URL
 */
class HttpToolGateway : public IToolGateway {
public:
    explicit HttpToolGateway(ToolGatewayConfig config);

    std::string execute(const llm::ToolCall& call) override;

    /// Failure payload returned in place of a result
    static std::string failure(const std::string& message);

private:
    ToolGatewayConfig config_;
};

} // namespace parley

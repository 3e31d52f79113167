#include "tools/tool_gateway.h"
#include "logger.h"
#include "net/http_client.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace parley {

HttpToolGateway::HttpToolGateway(ToolGatewayConfig config)
    : config_(std::move(config)) {}

std::string HttpToolGateway::failure(const std::string& message) {
    json result = {{"success", false}, {"message", message}};
    return result.dump();
}

std::string HttpToolGateway::execute(const llm::ToolCall& call) {
    if (config_.url.empty()) {
        return failure("tool gateway is not configured");
    }

    // Arguments arrive as a JSON string from the model; send them as an object
    json arguments = json::object();
    if (!call.arguments.empty()) {
        try {
            arguments = json::parse(call.arguments);
        } catch (const json::parse_error& e) {
            LOG_WARN("Tool " + call.name + " has malformed arguments: " + e.what());
            return failure("invalid arguments for " + call.name);
        }
    }

    json body = {
        {"name", call.name},
        {"arguments", arguments},
        {"call_id", config_.call_id}
    };

    http::Request request;
    request.url = config_.url;
    request.method = "POST";
    request.body = body.dump();
    request.timeout_ms = config_.timeout_ms;
    request.headers.push_back("Content-Type: application/json");
    if (!config_.api_key.empty()) {
        request.headers.push_back("Authorization: Bearer " + config_.api_key);
    }

    LOG_INFO("Executing tool " + call.name + " (" + call.id + ")");
    auto response = http::perform(request);
    if (!response.ok()) {
        LOG_WARN("Tool " + call.name + " failed: " + response.error);
        return failure(response.error);
    }
    if (!response.value->ok()) {
        LOG_WARN("Tool " + call.name + " returned HTTP " + std::to_string(response.value->status));
        return failure("tool gateway returned HTTP " + std::to_string(response.value->status));
    }

    const std::string& text = response.value->body;
    if (text.empty()) {
        json ok = {{"success", true}};
        return ok.dump();
    }
    if (!json::accept(text)) {
        return failure("tool gateway returned a non-JSON body");
    }
    return text;
}

} // namespace parley

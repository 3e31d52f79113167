#include "llm/openai_llm_client.h"
#include "errors.h"
#include "logger.h"
#include "net/http_client.h"
#include "utils.h"
#include <nlohmann/json.hpp>
#include <atomic>
#include <sstream>

using json = nlohmann::json;

namespace parley {
namespace llm {

std::string tool_calls_to_json(const std::vector<ToolCall>& calls) {
    json arr = json::array();
    for (const auto& call : calls) {
        arr.push_back({
            {"id", call.id},
            {"type", "function"},
            {"function", {{"name", call.name}, {"arguments", call.arguments}}}
        });
    }
    return arr.dump();
}

// =============================================================================
// SseCompletionParser
// =============================================================================

SseCompletionParser::SseCompletionParser(TokenCallback on_token)
    : on_token_(std::move(on_token)) {}

void SseCompletionParser::feed(const char* data, size_t size) {
    pending_.append(data, size);
    size_t start = 0;
    size_t newline;
    while ((newline = pending_.find('\n', start)) != std::string::npos) {
        handle_line(pending_.substr(start, newline - start));
        start = newline + 1;
    }
    pending_.erase(0, start);
}

Completion SseCompletionParser::finish() {
    if (!pending_.empty()) {
        handle_line(pending_);
        pending_.clear();
    }
    return completion_;
}

void SseCompletionParser::handle_line(const std::string& raw) {
    std::string line = raw;
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    if (line.empty() || line[0] == ':') {
        return;
    }
    if (!utils::starts_with(line, "data:")) {
        if (!utils::starts_with(line, "event:") && !utils::starts_with(line, "id:") &&
            stray_.size() < 4096) {
            stray_ += line;
        }
        return;
    }

    std::string payload = utils::trim_copy(line.substr(5));
    if (payload == "[DONE]") {
        done_ = true;
        return;
    }

    json chunk;
    try {
        chunk = json::parse(payload);
    } catch (const json::exception& e) {
        LOG_WARN(std::string("[LLM] Skipping malformed stream chunk: ") + e.what());
        return;
    }

    if (chunk.contains("error")) {
        stray_ += chunk["error"].dump();
        return;
    }
    if (!chunk.contains("choices") || !chunk["choices"].is_array() || chunk["choices"].empty()) {
        return;
    }

    const json& choice = chunk["choices"][0];
    if (choice.contains("delta") && choice["delta"].is_object()) {
        const json& delta = choice["delta"];

        if (delta.contains("content") && delta["content"].is_string()) {
            std::string text = delta["content"].get<std::string>();
            if (!text.empty()) {
                completion_.content += text;
                if (on_token_) on_token_(text);
            }
        }

        if (delta.contains("tool_calls") && delta["tool_calls"].is_array()) {
            for (const auto& tc : delta["tool_calls"]) {
                size_t index = tc.value("index", 0);
                if (completion_.tool_calls.size() <= index) {
                    completion_.tool_calls.resize(index + 1);
                }
                ToolCall& call = completion_.tool_calls[index];
                if (tc.contains("id") && tc["id"].is_string()) {
                    call.id = tc["id"].get<std::string>();
                }
                if (tc.contains("function") && tc["function"].is_object()) {
                    const json& fn = tc["function"];
                    if (fn.contains("name") && fn["name"].is_string()) {
                        call.name += fn["name"].get<std::string>();
                    }
                    if (fn.contains("arguments") && fn["arguments"].is_string()) {
                        call.arguments += fn["arguments"].get<std::string>();
                    }
                }
            }
        }
    }

    if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
        completion_.finish_reason = choice["finish_reason"].get<std::string>();
    }
}

// =============================================================================
// OpenAiLlmClient
// =============================================================================

class OpenAiLlmClient::Impl {
public:
    explicit Impl(const OpenAiConfig& config) : config_(config) {
        LOG_LLM("Client ready: " + config_.endpoint + " (text=" + config_.text_model +
                ", vision=" + config_.vision_model + ")");
    }

    std::string select_model(const std::vector<memory::ContextMessage>& messages) const {
        for (const auto& msg : messages) {
            if (msg.has_image()) {
                return config_.vision_model;
            }
        }
        return config_.text_model;
    }

    std::string build_request(const std::vector<memory::ContextMessage>& messages,
                              const std::string& tools_json) const {
        json request;
        request["model"] = select_model(messages);
        request["messages"] = json::parse(memory::ConversationContext::to_json(messages));
        request["stream"] = true;
        request["temperature"] = config_.temperature;
        request["max_tokens"] = config_.max_tokens;

        if (!utils::is_empty_or_whitespace(tools_json)) {
            json tools;
            try {
                tools = json::parse(tools_json);
            } catch (const json::exception& e) {
                throw ConfigurationError(std::string("invalid tool definitions: ") + e.what());
            }
            if (tools.is_array() && !tools.empty()) {
                request["tools"] = tools;
                request["tool_choice"] = "auto";
            }
        }
        return request.dump();
    }

    Completion complete(const std::vector<memory::ContextMessage>& messages,
                        const std::string& tools_json,
                        const TokenCallback& on_token) {
        const uint64_t generation = abort_generation_.load();
        auto aborted = [this, generation]() { return abort_generation_.load() != generation; };

        http::Request request;
        request.url = config_.endpoint;
        request.method = "POST";
        request.body = build_request(messages, tools_json);
        request.headers = {"Content-Type: application/json", "Accept: text/event-stream"};
        if (!config_.api_key.empty()) {
            request.headers.push_back("Authorization: Bearer " + config_.api_key);
        }
        request.timeout_ms = config_.timeout_ms;
        request.cancelled = aborted;

        SseCompletionParser parser([&](const std::string& delta) {
            if (!aborted()) on_token(delta);
        });

        auto start = Clock::now();
        auto result = http::perform_streaming(request, [&](const char* data, size_t size) {
            if (aborted()) return false;
            parser.feed(data, size);
            return !aborted();
        });

        if (aborted()) {
            Completion completion = parser.finish();
            completion.aborted = true;
            LOG_LLM("Completion aborted after " + std::to_string(ms_since(start)) + "ms");
            return completion;
        }
        if (result.failed()) {
            throw UpstreamServiceError("LLM request failed: " + result.error);
        }

        long status = *result.value;
        if (status < 200 || status >= 300) {
            throw UpstreamServiceError("LLM HTTP " + std::to_string(status) + ": " +
                                       utils::truncate_utf8(parser.stray(), 300));
        }

        Completion completion = parser.finish();
        std::ostringstream oss;
        oss << "(" << ms_since(start) << "ms) " << completion.content.size() << " chars, "
            << completion.tool_calls.size() << " tool calls, finish=" << completion.finish_reason;
        LOG_LLM(oss.str());
        return completion;
    }

    void abort() {
        abort_generation_.fetch_add(1);
    }

private:
    OpenAiConfig config_;
    std::atomic<uint64_t> abort_generation_{0};
};

OpenAiLlmClient::OpenAiLlmClient(const OpenAiConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

OpenAiLlmClient::~OpenAiLlmClient() = default;

Completion OpenAiLlmClient::complete(const std::vector<memory::ContextMessage>& messages,
                                     const std::string& tools_json,
                                     const TokenCallback& on_token) {
    return pimpl_->complete(messages, tools_json, on_token);
}

void OpenAiLlmClient::abort() {
    pimpl_->abort();
}

std::string OpenAiLlmClient::select_model(const std::vector<memory::ContextMessage>& messages) const {
    return pimpl_->select_model(messages);
}

std::string OpenAiLlmClient::build_request(const std::vector<memory::ContextMessage>& messages,
                                           const std::string& tools_json) const {
    return pimpl_->build_request(messages, tools_json);
}

} // namespace llm
} // namespace parley

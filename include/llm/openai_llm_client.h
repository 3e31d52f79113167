#pragma once

/**
 * @file openai_llm_client.h
 * @brief OpenAI-compatible chat completions over libcurl (server-sent events)
 */

#include "llm/language_model.h"
#include "core/constants.h"
#include <memory>
#include <string>

namespace parley {
namespace llm {

struct OpenAiConfig {
    std::string endpoint = "https://api.x.ai/v1/chat/completions";
    std::string api_key;
    std::string text_model = "grok-3";
    std::string vision_model = "grok-4";
    float temperature = constants::llm::DEFAULT_TEMPERATURE;
    int max_tokens = constants::llm::DEFAULT_MAX_TOKENS;
    int timeout_ms = constants::llm::DEFAULT_TIMEOUT_MS;
};

class OpenAiLlmClient : public ILanguageModel {
public:
    explicit OpenAiLlmClient(const OpenAiConfig& config);
    ~OpenAiLlmClient() override;

    // Non-copyable
    OpenAiLlmClient(const OpenAiLlmClient&) = delete;
    OpenAiLlmClient& operator=(const OpenAiLlmClient&) = delete;

    Completion complete(const std::vector<memory::ContextMessage>& messages,
                        const std::string& tools_json,
                        const TokenCallback& on_token) override;

    void abort() override;

    /// Model used for a request: the vision model when any message carries an image
    std::string select_model(const std::vector<memory::ContextMessage>& messages) const;

    /// Request body for a streamed completion
    std::string build_request(const std::vector<memory::ContextMessage>& messages,
                              const std::string& tools_json) const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

/**
 * @brief Incremental parser for an SSE chat-completion stream
 *
 * Accepts raw body bytes in arbitrary chunks, emits text deltas and
 * accumulates tool-call fragments by index.
 */
class SseCompletionParser {
public:
    explicit SseCompletionParser(TokenCallback on_token);

    void feed(const char* data, size_t size);

    /// Final result; flushes a trailing unterminated line
    Completion finish();

    bool done() const { return done_; }

    /// Body text that was not part of any data line (error payloads)
    const std::string& stray() const { return stray_; }

private:
    void handle_line(const std::string& line);

    TokenCallback on_token_;
    std::string pending_;
    std::string stray_;
    Completion completion_;
    bool done_ = false;
};

} // namespace llm
} // namespace parley

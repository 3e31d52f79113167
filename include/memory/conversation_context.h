#pragma once

/**
 * @file conversation_context.h
 * @brief Ordered conversation history for one session
 *
 * Features:
 * - System prompt plus optional caller-memory seeding
 * - Vision attachment on user turns through an injected AttachPolicy
 * - Read-only snapshots for the language model
 * - Export to OpenAI-compatible message JSON
 */

#include "core/types.h"
#include "core/constants.h"
#include "vision/attach_policy.h"
#include "vision/jpeg_encoder.h"
#include "vision/vision_snapshot.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace parley {
namespace memory {

/**
 * @brief Single message in the conversation
 *
 * Content is plain text, optionally paired with an attached image; the
 * pair is exported as a multi-part [text, image_url] payload.
 */
struct ContextMessage {
    MessageRole role = MessageRole::User;
    std::string content;
    std::string image_url;        // data:image/jpeg;base64,... when an image is attached
    std::string tool_call_id;     // For tool results
    std::string tool_calls_json;  // For assistant messages with tool calls

    bool has_image() const { return !image_url.empty(); }

    static ContextMessage system(const std::string& content);
    static ContextMessage user(const std::string& content);
    static ContextMessage assistant(const std::string& content);
    static ContextMessage assistant_with_tools(const std::string& content,
                                               const std::string& tool_calls_json);
    static ContextMessage tool(const std::string& tool_call_id, const std::string& content);
};

struct ContextOptions {
    std::string system_prompt;

    /// Appended to the system prompt when vision attachment can happen
    std::string vision_prompt_suffix;

    size_t max_seed_messages = constants::memory::MAX_SEED_MESSAGES;
    size_t max_seed_chars = constants::memory::MAX_SEED_CHARS;
    size_t transcript_max_chars = constants::memory::TRANSCRIPT_MAX_CHARS;
};

/// Called after every appended message with a text rendering of it
using TurnObserver = std::function<void(MessageRole role, const std::string& rendered)>;

/**
 * @brief Conversation context manager
 *
 * All mutation goes through this class. snapshot() copies the list under
 * the lock so the language model reads a stable view while new turns
 * arrive.
 */
class ConversationContext {
public:
    /**
     * @param options Prompt and seeding limits
     * @param policy Turn-attachment strategy (nullptr = never attach)
     * @param snapshots Vision side-channel to read from (nullptr = no vision)
     * @param encoder Snapshot encoder (required when snapshots is set)
     */
    ConversationContext(ContextOptions options,
                        std::unique_ptr<AttachPolicy> policy = nullptr,
                        const SnapshotStore* snapshots = nullptr,
                        std::shared_ptr<const JpegEncoder> encoder = nullptr);
    ~ConversationContext();

    // Non-copyable
    ConversationContext(const ConversationContext&) = delete;
    ConversationContext& operator=(const ConversationContext&) = delete;

    // =========================================================================
    // Message Management
    // =========================================================================

    /// Append a plain-text turn
    void add_turn(MessageRole role, const std::string& content);

    /**
     * @brief Append a user turn, attaching the latest snapshot if the policy agrees
     * @return True if an image was attached
     *
     * Encoding runs on a worker thread; a failed encode falls back to a
     * text-only turn.
     */
    bool add_user_turn(const std::string& text, TimePoint now = Clock::now());

    void add_assistant_tool_calls(const std::string& content, const std::string& tool_calls_json);
    void add_tool_result(const std::string& tool_call_id, const std::string& content);

    /**
     * @brief Seed prior-call memory: {"meta": "...", "messages": [{role, content}]}
     * @return Number of messages seeded (0 for absent or malformed memory)
     */
    size_t seed_from_memory(const std::string& caller_memory_json);

    // =========================================================================
    // Query
    // =========================================================================

    /// Copy of all messages, system prompt first
    std::vector<ContextMessage> snapshot() const;

    /// Last n user/assistant turns (for call summaries)
    std::vector<ContextMessage> recent_turns(size_t n) const;

    size_t size() const;

    /// True if any message carries an image
    bool has_image() const;

    const AttachPolicy* attach_policy() const;

    // =========================================================================
    // Export
    // =========================================================================

    /// OpenAI-compatible messages array
    std::string to_json() const;

    static std::string to_json(const std::vector<ContextMessage>& messages);

    /// Render content with image parts as "[image]", truncated to max_chars
    static std::string render(const ContextMessage& message, size_t max_chars);

    void set_turn_observer(TurnObserver observer);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace memory
} // namespace parley

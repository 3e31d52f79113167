/**
 * @file conversation_context.cpp
 * @brief Conversation context implementation
 */

#include "memory/conversation_context.h"
#include "errors.h"
#include "logger.h"
#include "utils.h"
#include <nlohmann/json.hpp>
#include <mutex>
#include <sstream>

using json = nlohmann::json;

namespace parley {
namespace memory {

namespace {

const char* kDefaultMemoryMeta =
    "Returning caller: the following messages are from a previous call with this caller. "
    "Use them as context.";

json message_to_json(const ContextMessage& msg) {
    json j;
    j["role"] = role_name(msg.role);

    if (msg.has_image()) {
        j["content"] = json::array({
            {{"type", "text"}, {"text", msg.content}},
            {{"type", "image_url"}, {"image_url", {{"url", msg.image_url}}}}
        });
    } else {
        j["content"] = msg.content;
    }

    if (!msg.tool_call_id.empty()) {
        j["tool_call_id"] = msg.tool_call_id;
    }
    if (!msg.tool_calls_json.empty()) {
        try {
            j["tool_calls"] = json::parse(msg.tool_calls_json);
        } catch (const json::exception& e) {
            LOG_WARN(std::string("Dropping malformed tool_calls from context: ") + e.what());
        }
    }
    return j;
}

} // anonymous namespace

// =============================================================================
// ContextMessage Factory Methods
// =============================================================================

ContextMessage ContextMessage::system(const std::string& content) {
    ContextMessage msg;
    msg.role = MessageRole::System;
    msg.content = content;
    return msg;
}

ContextMessage ContextMessage::user(const std::string& content) {
    ContextMessage msg;
    msg.role = MessageRole::User;
    msg.content = content;
    return msg;
}

ContextMessage ContextMessage::assistant(const std::string& content) {
    ContextMessage msg;
    msg.role = MessageRole::Assistant;
    msg.content = content;
    return msg;
}

ContextMessage ContextMessage::assistant_with_tools(const std::string& content,
                                                    const std::string& tool_calls_json) {
    ContextMessage msg = assistant(content);
    msg.tool_calls_json = tool_calls_json;
    return msg;
}

ContextMessage ContextMessage::tool(const std::string& tool_call_id, const std::string& content) {
    ContextMessage msg;
    msg.role = MessageRole::Tool;
    msg.content = content;
    msg.tool_call_id = tool_call_id;
    return msg;
}

// =============================================================================
// ConversationContext Implementation
// =============================================================================

class ConversationContext::Impl {
public:
    Impl(ContextOptions options, std::unique_ptr<AttachPolicy> policy,
         const SnapshotStore* snapshots, std::shared_ptr<const JpegEncoder> encoder)
        : options_(std::move(options))
        , policy_(policy ? std::move(policy) : std::make_unique<NeverAttachPolicy>())
        , snapshots_(snapshots)
        , encoder_(std::move(encoder)) {
        if (snapshots_ && !encoder_) {
            encoder_ = std::make_shared<JpegEncoder>();
        }

        std::string prompt = options_.system_prompt;
        if (snapshots_ && policy_->mode() != AttachMode::Never && !options_.vision_prompt_suffix.empty()) {
            prompt += options_.vision_prompt_suffix;
        }
        if (!prompt.empty()) {
            messages_.push_back(ContextMessage::system(prompt));
        }

        std::ostringstream oss;
        oss << "Context initialized: attach_mode=" << attach_mode_name(policy_->mode())
            << ", vision=" << (snapshots_ ? "on" : "off");
        LOG_CTX(oss.str());
    }

    void append(ContextMessage msg) {
        TurnObserver observer;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            messages_.push_back(msg);
            observer = observer_;
        }
        if (observer) {
            observer(msg.role, render(msg, options_.transcript_max_chars));
        }
    }

    bool add_user_turn(const std::string& raw_text, TimePoint now) {
        std::string text = utils::trim_copy(raw_text);
        if (text.empty()) {
            return false;
        }

        std::shared_ptr<const VisionSnapshot> snap;
        if (snapshots_) {
            snap = snapshots_->latest();
        }

        ContextMessage msg = ContextMessage::user(text);
        bool attached = false;

        if (snap && policy_->should_attach(text, snap.get(), now)) {
            // Runs on the user-context worker, never on capture or playback
            try {
                msg.image_url = encoder_->encode_data_url(*snap);
                attached = true;
                LOG_CTX("Attached vision frame to user turn (" + std::to_string(snap->width) +
                        "x" + std::to_string(snap->height) + ")");
            } catch (const MediaFormatError& e) {
                LOG_WARN(std::string("Vision attach failed, sending text only: ") + e.what());
            }
        }

        append(std::move(msg));
        return attached;
    }

    size_t seed_from_memory(const std::string& caller_memory_json) {
        if (utils::is_empty_or_whitespace(caller_memory_json)) {
            return 0;
        }

        json memory;
        try {
            memory = json::parse(caller_memory_json);
        } catch (const json::exception& e) {
            LOG_WARN(std::string("Ignoring malformed caller memory: ") + e.what());
            return 0;
        }
        if (!memory.is_object() || !memory.contains("messages") || !memory["messages"].is_array()) {
            return 0;
        }

        std::vector<ContextMessage> seeded;
        for (const auto& m : memory["messages"]) {
            if (!m.is_object()) continue;
            auto role = parse_role(m.value("role", ""));
            if (!role || (*role != MessageRole::User && *role != MessageRole::Assistant)) {
                continue;
            }
            if (!m.contains("content") || !m["content"].is_string()) continue;
            std::string content = utils::trim_copy(m["content"].get<std::string>());
            if (content.empty()) continue;

            ContextMessage msg;
            msg.role = *role;
            msg.content = utils::truncate_utf8(content, options_.max_seed_chars);
            seeded.push_back(std::move(msg));
        }

        // Keep the most recent messages
        if (seeded.size() > options_.max_seed_messages) {
            seeded.erase(seeded.begin(),
                         seeded.end() - static_cast<std::ptrdiff_t>(options_.max_seed_messages));
        }
        if (seeded.empty()) {
            return 0;
        }

        std::string meta;
        if (memory.contains("meta") && memory["meta"].is_string()) {
            meta = utils::trim_copy(memory["meta"].get<std::string>());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            messages_.push_back(ContextMessage::system(meta.empty() ? kDefaultMemoryMeta : meta));
            messages_.insert(messages_.end(), seeded.begin(), seeded.end());
        }

        LOG_CTX("Seeded " + std::to_string(seeded.size()) + " messages from caller memory");
        return seeded.size();
    }

    std::vector<ContextMessage> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

    std::vector<ContextMessage> recent_turns(size_t n) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<ContextMessage> turns;
        for (auto it = messages_.rbegin(); it != messages_.rend() && turns.size() < n; ++it) {
            if (it->role == MessageRole::User ||
                (it->role == MessageRole::Assistant && !it->content.empty())) {
                turns.push_back(*it);
            }
        }
        return std::vector<ContextMessage>(turns.rbegin(), turns.rend());
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_.size();
    }

    bool has_image() const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& m : messages_) {
            if (m.has_image()) return true;
        }
        return false;
    }

    const AttachPolicy* attach_policy() const { return policy_.get(); }

    void set_turn_observer(TurnObserver observer) {
        std::lock_guard<std::mutex> lock(mutex_);
        observer_ = std::move(observer);
    }

private:
    ContextOptions options_;
    std::unique_ptr<AttachPolicy> policy_;
    const SnapshotStore* snapshots_;
    std::shared_ptr<const JpegEncoder> encoder_;

    mutable std::mutex mutex_;
    std::vector<ContextMessage> messages_;
    TurnObserver observer_;
};

// =============================================================================
// ConversationContext Public Interface
// =============================================================================

ConversationContext::ConversationContext(ContextOptions options,
                                         std::unique_ptr<AttachPolicy> policy,
                                         const SnapshotStore* snapshots,
                                         std::shared_ptr<const JpegEncoder> encoder)
    : impl_(std::make_unique<Impl>(std::move(options), std::move(policy), snapshots, std::move(encoder))) {}

ConversationContext::~ConversationContext() = default;

void ConversationContext::add_turn(MessageRole role, const std::string& content) {
    ContextMessage msg;
    msg.role = role;
    msg.content = content;
    impl_->append(std::move(msg));
}

bool ConversationContext::add_user_turn(const std::string& text, TimePoint now) {
    return impl_->add_user_turn(text, now);
}

void ConversationContext::add_assistant_tool_calls(const std::string& content,
                                                   const std::string& tool_calls_json) {
    impl_->append(ContextMessage::assistant_with_tools(content, tool_calls_json));
}

void ConversationContext::add_tool_result(const std::string& tool_call_id, const std::string& content) {
    impl_->append(ContextMessage::tool(tool_call_id, content));
}

size_t ConversationContext::seed_from_memory(const std::string& caller_memory_json) {
    return impl_->seed_from_memory(caller_memory_json);
}

std::vector<ContextMessage> ConversationContext::snapshot() const {
    return impl_->snapshot();
}

std::vector<ContextMessage> ConversationContext::recent_turns(size_t n) const {
    return impl_->recent_turns(n);
}

size_t ConversationContext::size() const {
    return impl_->size();
}

bool ConversationContext::has_image() const {
    return impl_->has_image();
}

const AttachPolicy* ConversationContext::attach_policy() const {
    return impl_->attach_policy();
}

std::string ConversationContext::to_json() const {
    return to_json(impl_->snapshot());
}

std::string ConversationContext::to_json(const std::vector<ContextMessage>& messages) {
    json arr = json::array();
    for (const auto& msg : messages) {
        arr.push_back(message_to_json(msg));
    }
    return arr.dump();
}

std::string ConversationContext::render(const ContextMessage& message, size_t max_chars) {
    std::string text = message.content;
    if (message.has_image()) {
        text += text.empty() ? "[image]" : " [image]";
    }
    if (max_chars > 0) {
        text = utils::truncate_utf8(text, max_chars);
    }
    return text;
}

void ConversationContext::set_turn_observer(TurnObserver observer) {
    impl_->set_turn_observer(std::move(observer));
}

} // namespace memory
} // namespace parley

/**
 * @file types.cpp
 * @brief Implementation of core type helper functions
 */

#include "core/types.h"
#include "utils.h"

namespace parley {

const char* role_name(MessageRole role) {
    switch (role) {
        case MessageRole::System: return "system";
        case MessageRole::User: return "user";
        case MessageRole::Assistant: return "assistant";
        case MessageRole::Tool: return "tool";
    }
    return "user";
}

std::optional<MessageRole> parse_role(const std::string& name) {
    std::string lower = utils::normalize_copy(utils::trim_copy(name));
    if (lower == "system") return MessageRole::System;
    if (lower == "user") return MessageRole::User;
    if (lower == "assistant") return MessageRole::Assistant;
    if (lower == "tool") return MessageRole::Tool;
    return std::nullopt;
}

} // namespace parley

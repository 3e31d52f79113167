#include "vision/attach_policy.h"
#include "utils.h"

namespace parley {

std::optional<AttachMode> parse_attach_mode(const std::string& name) {
    std::string lower = utils::normalize_copy(utils::trim_copy(name));
    if (lower == "always") return AttachMode::Always;
    if (lower == "auto") return AttachMode::Auto;
    if (lower == "never") return AttachMode::Never;
    return std::nullopt;
}

const char* attach_mode_name(AttachMode mode) {
    switch (mode) {
        case AttachMode::Always: return "always";
        case AttachMode::Auto: return "auto";
        case AttachMode::Never: return "never";
    }
    return "always";
}

const std::vector<std::string>& default_visual_keywords() {
    static const std::vector<std::string> keywords = {
        "see", "look", "show", "camera", "image", "photo", "picture", "screen",
        "read", "what is this", "what's this", "who is", "what am i",
        "wearing", "holding", "color", "colour", "shirt", "hat", "glasses",
        "sign", "logo", "text"
    };
    return keywords;
}

bool AttachPolicy::should_attach(const std::string& text, const VisionSnapshot* snapshot,
                                 TimePoint now) const {
    if (!wants_image(text)) {
        return false;
    }
    if (!snapshot || snapshot->image.empty()) {
        return false;
    }
    if (max_age_s_ > 0.0 && snapshot->age_seconds(now) > max_age_s_) {
        return false;
    }
    return true;
}

KeywordAttachPolicy::KeywordAttachPolicy(double max_age_s, std::vector<std::string> keywords)
    : AttachPolicy(max_age_s), keywords_(std::move(keywords)) {
    if (keywords_.empty()) {
        keywords_ = default_visual_keywords();
    }
    for (auto& k : keywords_) {
        utils::normalize(k);
    }
}

bool KeywordAttachPolicy::wants_image(const std::string& text) const {
    std::string lower = utils::normalize_copy(utils::trim_copy(text));
    if (lower.empty()) {
        return false;
    }
    for (const auto& keyword : keywords_) {
        if (!keyword.empty() && lower.find(keyword) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::unique_ptr<AttachPolicy> make_attach_policy(AttachMode mode, double max_age_s,
                                                 std::vector<std::string> keywords) {
    switch (mode) {
        case AttachMode::Never:
            return std::make_unique<NeverAttachPolicy>();
        case AttachMode::Auto:
            return std::make_unique<KeywordAttachPolicy>(max_age_s, std::move(keywords));
        case AttachMode::Always:
        default:
            return std::make_unique<AlwaysAttachPolicy>(max_age_s);
    }
}

} // namespace parley

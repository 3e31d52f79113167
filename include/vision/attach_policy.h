#pragma once

/**
 * @file attach_policy.h
 * @brief Decides whether a user turn carries the latest camera snapshot
 */

#include "vision/vision_snapshot.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace parley {

enum class AttachMode {
    Always,
    Auto,
    Never
};

std::optional<AttachMode> parse_attach_mode(const std::string& name);
const char* attach_mode_name(AttachMode mode);

/// Phrases that suggest the participant is referring to something visual
const std::vector<std::string>& default_visual_keywords();

/**
 * @brief Turn-attachment strategy injected into the conversation context
 *
 * should_attach() combines the mode-specific wants_image() with the
 * shared checks: a snapshot must exist and be no older than max_age
 * (max_age <= 0 disables the age check).
 */
class AttachPolicy {
public:
    explicit AttachPolicy(double max_age_s) : max_age_s_(max_age_s) {}
    virtual ~AttachPolicy() = default;

    bool should_attach(const std::string& text, const VisionSnapshot* snapshot, TimePoint now) const;

    virtual AttachMode mode() const = 0;
    double max_age_s() const { return max_age_s_; }

protected:
    virtual bool wants_image(const std::string& text) const = 0;

private:
    double max_age_s_;
};

class AlwaysAttachPolicy : public AttachPolicy {
public:
    using AttachPolicy::AttachPolicy;
    AttachMode mode() const override { return AttachMode::Always; }

protected:
    bool wants_image(const std::string&) const override { return true; }
};

class NeverAttachPolicy : public AttachPolicy {
public:
    NeverAttachPolicy() : AttachPolicy(0.0) {}
    AttachMode mode() const override { return AttachMode::Never; }

protected:
    bool wants_image(const std::string&) const override { return false; }
};

/**
 * @brief Attaches only when the lowercased turn text contains a keyword
 */
class KeywordAttachPolicy : public AttachPolicy {
public:
    KeywordAttachPolicy(double max_age_s, std::vector<std::string> keywords);
    AttachMode mode() const override { return AttachMode::Auto; }

protected:
    bool wants_image(const std::string& text) const override;

private:
    std::vector<std::string> keywords_;
};

std::unique_ptr<AttachPolicy> make_attach_policy(AttachMode mode, double max_age_s,
                                                 std::vector<std::string> keywords = {});

} // namespace parley

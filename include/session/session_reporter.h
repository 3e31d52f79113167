#pragma once

/**
 * @file session_reporter.h
 * @brief End-of-call summary delivery
 */

#include "memory/conversation_context.h"
#include <string>
#include <vector>

namespace parley {

struct CallSummary {
    std::string call_id;
    double duration_s = 0.0;
    bool transferred = false;
    std::string result;                             ///< "completed", "cancelled" or "failed"
    std::string detail;                             ///< Run status message, if any
    std::vector<memory::ContextMessage> final_turns;
};

class ISessionReporter {
public:
    virtual ~ISessionReporter() = default;

    virtual void report(const CallSummary& summary) = 0;
};

/**
 * @brief Logs the summary as one JSON line
 */
class LogSessionReporter : public ISessionReporter {
public:
    explicit LogSessionReporter(size_t max_chars_per_turn = 500);

    void report(const CallSummary& summary) override;

    /// JSON document logged by report()
    std::string to_json(const CallSummary& summary) const;

private:
    size_t max_chars_per_turn_;
};

} // namespace parley

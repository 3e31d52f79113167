#include "session/session_reporter.h"
#include "logger.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace parley {

LogSessionReporter::LogSessionReporter(size_t max_chars_per_turn)
    : max_chars_per_turn_(max_chars_per_turn) {}

std::string LogSessionReporter::to_json(const CallSummary& summary) const {
    json turns = json::array();
    for (const auto& turn : summary.final_turns) {
        turns.push_back({
            {"role", role_name(turn.role)},
            {"content", memory::ConversationContext::render(turn, max_chars_per_turn_)}
        });
    }

    json doc = {
        {"call_id", summary.call_id},
        {"duration_s", summary.duration_s},
        {"transferred", summary.transferred},
        {"result", summary.result},
        {"final_turns", turns}
    };
    if (!summary.detail.empty()) {
        doc["detail"] = summary.detail;
    }
    return doc.dump();
}

void LogSessionReporter::report(const CallSummary& summary) {
    LOG_INFO("Call summary: " + to_json(summary));
}

} // namespace parley

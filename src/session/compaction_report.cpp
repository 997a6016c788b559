#include "session/compaction_report.hpp"

#include <algorithm>

namespace logcompact::session {

using nlohmann::json;
using protocol::OutcomeStatus;

std::string LogOutcome::status_text() const {
    if (status == OutcomeStatus::Failed) {
        return "failed:" + (error.has_value()
                                ? core::errors::error_kind(error->category)
                                : std::string("UnknownError"));
    }
    return protocol::to_string(status);
}

bool CompactionReport::any_failed() const {
    return std::any_of(outcomes.begin(), outcomes.end(), [](const LogOutcome& o) {
        return o.status == OutcomeStatus::Failed;
    });
}

std::size_t CompactionReport::total_removed() const {
    std::size_t total = 0;
    for (const auto& outcome : outcomes) {
        if (outcome.result.has_value()) {
            total += outcome.result->removed_count;
        }
    }
    return total;
}

std::size_t CompactionReport::total_merged() const {
    std::size_t total = 0;
    for (const auto& outcome : outcomes) {
        if (outcome.result.has_value()) {
            total += outcome.result->merged_count;
        }
    }
    return total;
}

std::size_t CompactionReport::tokens_before() const {
    std::size_t total = 0;
    for (const auto& outcome : outcomes) {
        if (outcome.result.has_value()) {
            total += outcome.result->tokens_before;
        }
    }
    return total;
}

std::size_t CompactionReport::tokens_after() const {
    std::size_t total = 0;
    for (const auto& outcome : outcomes) {
        if (outcome.result.has_value()) {
            total += outcome.result->tokens_after;
        }
    }
    return total;
}

std::vector<std::string> CompactionReport::render() const {
    std::vector<std::string> lines;
    lines.reserve(outcomes.size());
    for (const auto& outcome : outcomes) {
        std::string line = outcome.log_id + ": " + outcome.status_text();
        if (outcome.status == OutcomeStatus::Compacted && outcome.result.has_value()) {
            line += " (removed=" + std::to_string(outcome.result->removed_count) +
                    ", merged=" + std::to_string(outcome.result->merged_count) + ")";
        } else if (outcome.status == OutcomeStatus::Failed && outcome.error.has_value()) {
            line += " " + outcome.error->message;
        }
        lines.push_back(line);
    }
    return lines;
}

json CompactionReport::to_json() const {
    json payload;
    payload["batch_id"] = batch_id;
    payload["any_failed"] = any_failed();
    payload["removed_count"] = total_removed();
    payload["merged_count"] = total_merged();
    payload["tokens_before"] = tokens_before();
    payload["tokens_after"] = tokens_after();

    json logs = json::array();
    for (const auto& outcome : outcomes) {
        json entry;
        entry["log_id"] = outcome.log_id;
        entry["status"] = outcome.status_text();
        if (outcome.result.has_value()) {
            entry["removed_count"] = outcome.result->removed_count;
            entry["merged_count"] = outcome.result->merged_count;
        }
        if (outcome.error.has_value()) {
            entry["error_kind"] = core::errors::error_kind(outcome.error->category);
            entry["error_code"] = outcome.error->code;
            entry["error_message"] = outcome.error->message;
        }
        logs.push_back(entry);
    }
    payload["logs"] = logs;
    return payload;
}

}  // namespace logcompact::session

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/compaction_errors.hpp"
#include "protocol/compaction_contract.hpp"

namespace logcompact::session {

struct LogOutcome {
    std::string log_id;
    protocol::OutcomeStatus status = protocol::OutcomeStatus::Cancelled;
    std::optional<protocol::CompactionResult> result;
    std::optional<core::errors::CompactionError> error;

    // "compacted", "unchanged", "failed:<Kind>" or "cancelled"
    std::string status_text() const;
};

struct CompactionReport {
    std::string batch_id;
    std::vector<LogOutcome> outcomes;

    bool any_failed() const;
    std::size_t total_removed() const;
    std::size_t total_merged() const;
    std::size_t tokens_before() const;
    std::size_t tokens_after() const;

    // One line per log, in store order.
    std::vector<std::string> render() const;
    nlohmann::json to_json() const;
};

}  // namespace logcompact::session

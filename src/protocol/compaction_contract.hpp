#pragma once

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>
#include "protocol/message_contract.hpp"

namespace logcompact::protocol {

struct CompactionResult {
    std::vector<Message> messages;
    std::size_t removed_count = 0;
    std::size_t merged_count = 0;

    // Keys carried by the output messages. Merging unions keys, so every key
    // on a surviving message is still present here.
    std::set<std::string> preserved_metadata_keys;

    // Output messages per role, e.g. for "user kept: 4" style statistics.
    std::map<Role, std::size_t> retained_by_role;

    std::size_t tokens_before = 0;
    std::size_t tokens_after = 0;
    std::size_t passes = 0;

    bool changed() const { return removed_count + merged_count > 0; }
};

enum class OutcomeStatus {
    Compacted,
    Unchanged,
    Failed,
    Cancelled
};

inline std::string to_string(const OutcomeStatus status) {
    switch (status) {
        case OutcomeStatus::Compacted:
            return "compacted";
        case OutcomeStatus::Unchanged:
            return "unchanged";
        case OutcomeStatus::Failed:
            return "failed";
        case OutcomeStatus::Cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

}  // namespace logcompact::protocol

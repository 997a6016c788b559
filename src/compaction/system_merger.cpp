#include "compaction/system_merger.hpp"

#include <utility>

namespace logcompact::compaction {

using protocol::Message;

SystemMessageMerger::SystemMessageMerger(std::string delimiter)
    : delimiter_(std::move(delimiter)) {}

MergeOutcome SystemMessageMerger::merge(const std::vector<Message>& messages) const {
    MergeOutcome outcome;
    outcome.messages.reserve(messages.size());

    auto it = messages.begin();
    while (it != messages.end()) {
        if (!protocol::is_system(*it)) {
            outcome.messages.push_back(*it);
            ++it;
            continue;
        }

        auto run_end = it;
        while (run_end != messages.end() && protocol::is_system(*run_end)) {
            ++run_end;
        }

        if (run_end - it >= 2) {
            outcome.messages.push_back(merge_run(it, run_end));
            ++outcome.merged_count;
        } else {
            outcome.messages.push_back(*it);
        }
        it = run_end;
    }
    return outcome;
}

Message SystemMessageMerger::merge_run(
    std::vector<Message>::const_iterator first,
    std::vector<Message>::const_iterator last) const {
    Message merged;
    merged.role = first->role;
    merged.sequence_index = first->sequence_index;

    bool leading = true;
    for (auto it = first; it != last; ++it) {
        if (!leading) {
            merged.content += delimiter_;
        }
        merged.content += it->content;
        leading = false;

        // emplace never overwrites, so the earliest value of a key survives.
        for (const auto& [key, value] : it->metadata) {
            merged.metadata.emplace(key, value);
        }
    }
    return merged;
}

}  // namespace logcompact::compaction

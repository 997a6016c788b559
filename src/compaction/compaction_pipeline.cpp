#include "compaction/compaction_pipeline.hpp"

#include <cctype>
#include <utility>
#include "core/logging/logger.hpp"

namespace logcompact::compaction {

using core::errors::CompactionError;
using core::errors::ErrorCategory;
using protocol::CompactionResult;
using protocol::Log;
using protocol::Message;

std::size_t estimate_tokens(const std::vector<Message>& messages) {
    std::size_t words = 0;
    for (const auto& message : messages) {
        bool in_word = false;
        for (const char c : message.content) {
            if (std::isspace(static_cast<unsigned char>(c)) != 0) {
                in_word = false;
                continue;
            }
            if (!in_word) {
                ++words;
                in_word = true;
            }
        }
    }
    return words;
}

CompactionPipeline::CompactionPipeline(DuplicateDetector detector,
                                       SystemMessageMerger merger)
    : detector_(std::move(detector)), merger_(std::move(merger)) {}

core::errors::Result<CompactionPipeline> CompactionPipeline::create(
    const core::config::CompactionConfig& config) {
    auto detector = DuplicateDetector::create(config.window_size);
    if (core::errors::is_error(detector)) {
        return core::errors::get_error(detector);
    }
    return CompactionPipeline(core::errors::get_value(detector),
                              SystemMessageMerger(config.merge_delimiter));
}

core::errors::Result<bool> CompactionPipeline::validate_snapshot(const Log& log) {
    for (std::size_t i = 0; i < log.messages.size(); ++i) {
        const Message& message = log.messages[i];
        if (!message.role.has_value()) {
            return CompactionError{ErrorCategory::MalformedLog,
                                   "Message " + std::to_string(i) + " of log " +
                                       log.session_id + " has no role.",
                                   "missing_role"};
        }
        if (i > 0 && message.sequence_index <= log.messages[i - 1].sequence_index) {
            return CompactionError{ErrorCategory::MalformedLog,
                                   "Message " + std::to_string(i) + " of log " +
                                       log.session_id +
                                       " breaks sequence order (index " +
                                       std::to_string(message.sequence_index) +
                                       ").",
                                   "broken_ordering"};
        }
    }
    return true;
}

core::errors::Result<CompactionResult> CompactionPipeline::run(const Log& log) const {
    auto valid = validate_snapshot(log);
    if (core::errors::is_error(valid)) {
        return core::errors::get_error(valid);
    }

    CompactionResult result;
    result.tokens_before = estimate_tokens(log.messages);

    std::vector<Message> current = log.messages;
    while (true) {
        ++result.passes;

        const std::vector<bool> drop = detector_.mark(current);
        std::vector<Message> kept;
        kept.reserve(current.size());
        std::size_t removed = 0;
        for (std::size_t i = 0; i < current.size(); ++i) {
            if (drop[i]) {
                ++removed;
                continue;
            }
            kept.push_back(std::move(current[i]));
        }

        MergeOutcome merged = merger_.merge(kept);
        result.removed_count += removed;
        result.merged_count += merged.merged_count;
        current = std::move(merged.messages);

        // A pass can only shrink the log, so this terminates.
        if (removed == 0 && merged.merged_count == 0) {
            break;
        }
        LOG_DEBUG("Pipeline: log " + log.session_id + " pass " +
                  std::to_string(result.passes) + " removed " +
                  std::to_string(removed) + ", merged " +
                  std::to_string(merged.merged_count));
    }

    for (std::size_t i = 0; i < current.size(); ++i) {
        current[i].sequence_index = i;
        ++result.retained_by_role[current[i].role.value()];
        for (const auto& entry : current[i].metadata) {
            result.preserved_metadata_keys.insert(entry.first);
        }
    }

    result.tokens_after = estimate_tokens(current);
    result.messages = std::move(current);
    return result;
}

}  // namespace logcompact::compaction

#pragma once

#include <cstddef>
#include <vector>
#include "compaction/duplicate_detector.hpp"
#include "compaction/system_merger.hpp"
#include "core/config/compaction_config.hpp"
#include "core/errors/compaction_errors.hpp"
#include "protocol/compaction_contract.hpp"
#include "protocol/message_contract.hpp"

namespace logcompact::compaction {

// Rough token count: whitespace-delimited words across all contents.
std::size_t estimate_tokens(const std::vector<protocol::Message>& messages);

// Dedup followed by system merge, repeated until a pass changes nothing, then
// sequence indexes are re-stamped densely. A pure function of the snapshot:
// the same input always yields the same output, and running it on its own
// output drops and merges nothing.
class CompactionPipeline {
public:
    static core::errors::Result<CompactionPipeline> create(
        const core::config::CompactionConfig& config);

    core::errors::Result<protocol::CompactionResult> run(
        const protocol::Log& log) const;

private:
    CompactionPipeline(DuplicateDetector detector, SystemMessageMerger merger);

    static core::errors::Result<bool> validate_snapshot(const protocol::Log& log);

    DuplicateDetector detector_;
    SystemMessageMerger merger_;
};

}  // namespace logcompact::compaction

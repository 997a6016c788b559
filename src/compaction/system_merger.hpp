#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "protocol/message_contract.hpp"

namespace logcompact::compaction {

struct MergeOutcome {
    std::vector<protocol::Message> messages;
    std::size_t merged_count = 0;
};

// Collapses each maximal run of adjacent system messages into one message.
// Content is joined with the delimiter in run order, metadata is the union of
// the run with the earliest member winning a key conflict, and the merged
// message keeps the first member's sequence index.
class SystemMessageMerger {
public:
    explicit SystemMessageMerger(std::string delimiter = "\n");

    MergeOutcome merge(const std::vector<protocol::Message>& messages) const;

    const std::string& delimiter() const { return delimiter_; }

private:
    protocol::Message merge_run(std::vector<protocol::Message>::const_iterator first,
                                std::vector<protocol::Message>::const_iterator last) const;

    std::string delimiter_;
};

}  // namespace logcompact::compaction

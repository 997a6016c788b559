#pragma once

#include <cstddef>
#include <vector>
#include "core/errors/compaction_errors.hpp"
#include "protocol/message_contract.hpp"

namespace logcompact::compaction {

// Marks assistant retries, tool-result echoes and repeated system notes that
// repeat one of the last `window_size` retained messages. User turns are
// never marked: a literal re-ask is part of the conversation.
class DuplicateDetector {
public:
    static core::errors::Result<DuplicateDetector> create(int window_size);

    // One flag per input message; true means drop. Never reorders.
    std::vector<bool> mark(const std::vector<protocol::Message>& messages) const;

    std::size_t window_size() const { return window_size_; }

private:
    explicit DuplicateDetector(std::size_t window_size);

    std::size_t window_size_;
};

}  // namespace logcompact::compaction

#include "compaction/duplicate_detector.hpp"

#include <algorithm>
#include <deque>

namespace logcompact::compaction {

using core::errors::CompactionError;
using core::errors::ErrorCategory;
using protocol::Message;
using protocol::Role;

DuplicateDetector::DuplicateDetector(const std::size_t window_size)
    : window_size_(window_size) {}

core::errors::Result<DuplicateDetector> DuplicateDetector::create(
    const int window_size) {
    if (window_size <= 0) {
        return CompactionError{ErrorCategory::Configuration,
                               "Window size must be at least 1, got " +
                                   std::to_string(window_size),
                               "invalid_window_size"};
    }
    return DuplicateDetector(static_cast<std::size_t>(window_size));
}

std::vector<bool> DuplicateDetector::mark(
    const std::vector<Message>& messages) const {
    std::vector<bool> drop(messages.size(), false);
    if (messages.size() < 2) {
        return drop;
    }

    // Last retained messages, oldest first.
    std::deque<const Message*> window;
    for (std::size_t i = 0; i < messages.size(); ++i) {
        const Message& current = messages[i];

        if (current.role != Role::User) {
            const bool repeated = std::any_of(
                window.begin(), window.end(), [&current](const Message* kept) {
                    return protocol::equals_for_dedup(*kept, current);
                });
            if (repeated) {
                drop[i] = true;
                continue;
            }
        }

        window.push_back(&current);
        if (window.size() > window_size_) {
            window.pop_front();
        }
    }
    return drop;
}

}  // namespace logcompact::compaction

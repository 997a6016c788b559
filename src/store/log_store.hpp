#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/compaction_errors.hpp"
#include "protocol/message_contract.hpp"

namespace logcompact::store {

// Persistence contract consumed by the compaction runner.
class LogStore {
public:
    virtual ~LogStore() = default;

    // Every addressable log id, sorted.
    virtual core::errors::Result<std::vector<std::string>> list_logs() const = 0;

    virtual core::errors::Result<protocol::Log> read_log(
        const std::string& log_id) const = 0;

    // All-or-nothing: on failure the previously stored log stays visible.
    virtual core::errors::Result<std::filesystem::path> write_log(
        const std::string& log_id,
        const std::vector<protocol::Message>& messages) const = 0;
};

}  // namespace logcompact::store

#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include "core/config/compaction_config.hpp"

namespace logcompact::protocol {

    // Represents the validated user input required to start a compaction run
    struct CompactRequest {
        std::filesystem::path store_root;
        std::optional<std::string> session_id; // Empty means every stored session
        core::config::CompactionConfig config;
        bool json_output = false;
        bool verbose = false;
    };

} // namespace logcompact::protocol

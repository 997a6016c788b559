#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include "core/errors/compaction_errors.hpp"

namespace logcompact::core::config {

// Tunables recognized by the engine. Defaults match the documented contract.
struct CompactionConfig {
    int window_size = 3;
    std::string merge_delimiter = "\n";
    std::uint32_t jobs = 1;
    bool backup = true;
};

// Fails with a Configuration error when a tunable is out of range.
core::errors::Result<CompactionConfig> validate(const CompactionConfig& config);

// Overlays the keys present in a JSON config file onto `base`.
// Unknown keys are rejected so typos do not silently fall back to defaults.
core::errors::Result<CompactionConfig> load_config_file(
    const std::filesystem::path& path, const CompactionConfig& base = {});

}  // namespace logcompact::core::config

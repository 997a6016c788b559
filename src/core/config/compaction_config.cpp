#include "core/config/compaction_config.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>

namespace logcompact::core::config {

using core::errors::CompactionError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

CompactionError out_of_range(const std::string& key, const json& value) {
    return CompactionError{ErrorCategory::Configuration,
                           "Config value out of range for " + key + ": " + value.dump(),
                           "config_value_out_of_range",
                           "window_size and jobs must be positive 32-bit integers."};
}

}  // namespace

core::errors::Result<CompactionConfig> validate(const CompactionConfig& config) {
    if (config.window_size <= 0) {
        return CompactionError{ErrorCategory::Configuration,
                               "Window size must be at least 1, got " +
                                   std::to_string(config.window_size),
                               "invalid_window_size",
                               "Pass --window with a positive integer."};
    }
    if (config.jobs == 0) {
        return CompactionError{ErrorCategory::Configuration,
                               "Job count must be at least 1.",
                               "invalid_jobs"};
    }
    return config;
}

core::errors::Result<CompactionConfig> load_config_file(
    const std::filesystem::path& path, const CompactionConfig& base) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return CompactionError{ErrorCategory::Configuration,
                               "Unable to open config file: " + path.string(),
                               "config_open_failed"};
    }

    json doc;
    try {
        in >> doc;
    } catch (const json::parse_error& e) {
        return CompactionError{ErrorCategory::Configuration,
                               "Config file is not valid JSON: " +
                                   std::string(e.what()),
                               "config_parse_failed"};
    }
    if (!doc.is_object()) {
        return CompactionError{ErrorCategory::Configuration,
                               "Config file must contain a JSON object.",
                               "config_parse_failed"};
    }

    CompactionConfig config = base;
    for (const auto& [key, value] : doc.items()) {
        if (key == "window_size" && value.is_number_integer()) {
            // Read wide first so out-of-range values are rejected, not wrapped.
            const auto window = value.get<std::int64_t>();
            if (window < 1 || window > std::numeric_limits<int>::max()) {
                return out_of_range(key, value);
            }
            config.window_size = static_cast<int>(window);
        } else if (key == "merge_delimiter" && value.is_string()) {
            config.merge_delimiter = value.get<std::string>();
        } else if (key == "jobs" && value.is_number_integer()) {
            const auto jobs = value.get<std::int64_t>();
            if (value.is_number_unsigned() && value.get<std::uint64_t>() >
                                                  std::numeric_limits<std::uint32_t>::max()) {
                return out_of_range(key, value);
            }
            if (jobs < 1 || jobs > std::numeric_limits<std::uint32_t>::max()) {
                return out_of_range(key, value);
            }
            config.jobs = static_cast<std::uint32_t>(jobs);
        } else if (key == "backup" && value.is_boolean()) {
            config.backup = value.get<bool>();
        } else {
            return CompactionError{ErrorCategory::Configuration,
                                   "Unknown or mistyped config key: " + key,
                                   "invalid_config_key",
                                   "Recognized keys: window_size, merge_delimiter, jobs, backup."};
        }
    }
    return config;
}

}  // namespace logcompact::core::config

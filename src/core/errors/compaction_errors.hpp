#pragma once
#include <string>
#include <variant>

namespace logcompact::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Configuration,  // E.g., window size of zero
        MalformedLog,   // E.g., a message without a role, broken ordering
        StoreRead,      // E.g., conversation file missing or unreadable
        StoreWrite,     // E.g., temp file could not be written or swapped in
        Input,          // E.g., unknown CLI flag
        Internal        // E.g., a worker threw unexpectedly
    };

    // The standardized error payload
    struct CompactionError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the user
        };

    // 2. Propagation strategy (Result object)
    // A Result holds either a successful value of type T, OR a CompactionError.
    template <typename T>
    using Result = std::variant<T, CompactionError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<CompactionError>(result);
    }

    template <typename T>
    const CompactionError& get_error(const Result<T>& result) {
        return std::get<CompactionError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T& get_value(Result<T>& result) {
        return std::get<T>(result);
    }

    // Name used in outcome reports, e.g. "failed:MalformedLogError".
    inline std::string error_kind(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Configuration: return "ConfigurationError";
            case ErrorCategory::MalformedLog:  return "MalformedLogError";
            case ErrorCategory::StoreRead:     return "StoreReadError";
            case ErrorCategory::StoreWrite:    return "StoreWriteError";
            case ErrorCategory::Input:         return "InputError";
            case ErrorCategory::Internal:      return "InternalError";
            default: return "UnknownError";
        }
    }

} // namespace logcompact::core::errors

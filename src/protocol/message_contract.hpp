#pragma once
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace logcompact::protocol {

    enum class Role {
        User,
        Assistant,
        System,
        Tool
    };

    // Ordered so merges and serialization are deterministic.
    using Metadata = std::map<std::string, nlohmann::json>;

    // One entry of a conversation log.
    struct Message {
        // Empty only for malformed input; the pipeline rejects such messages.
        std::optional<Role> role;
        std::string content;

        // Every on-disk field besides role and content: timestamp, call_id, pinned...
        Metadata metadata;

        // Position in the log. Restores and verifies order, carries no meaning.
        std::uint64_t sequence_index = 0;
    };

    struct Log {
        std::string session_id;
        std::filesystem::path location;
        std::vector<Message> messages;
    };

    inline std::string to_string(const Role role) {
        switch (role) {
            case Role::User:
                return "user";
            case Role::Assistant:
                return "assistant";
            case Role::System:
                return "system";
            case Role::Tool:
                return "tool";
            default:
                return "unknown";
        }
    }

    inline std::optional<Role> parse_role(const std::string& text) {
        if (text == "user") return Role::User;
        if (text == "assistant") return Role::Assistant;
        if (text == "system") return Role::System;
        if (text == "tool") return Role::Tool;
        return std::nullopt;
    }

    // Two turns that differ only in metadata (e.g. timestamps) are still duplicates.
    inline bool equals_for_dedup(const Message& a, const Message& b) {
        return a.role == b.role && a.content == b.content;
    }

    inline bool is_system(const Message& m) {
        return m.role == Role::System;
    }

} // namespace logcompact::protocol

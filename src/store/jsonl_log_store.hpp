#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/compaction_errors.hpp"
#include "protocol/message_contract.hpp"
#include "store/log_store.hpp"

namespace logcompact::store {

struct JsonlStoreOptions {
    std::string log_file_name = "conversation.jsonl";
    std::string backup_file_name = "conversation.backup.jsonl";
    bool keep_backup = true;
};

// One directory per session under the store root, each holding a JSONL
// conversation file with one message object per line.
class JsonlLogStore : public LogStore {
public:
    explicit JsonlLogStore(std::filesystem::path root, JsonlStoreOptions options = {});

    core::errors::Result<std::vector<std::string>> list_logs() const override;

    core::errors::Result<protocol::Log> read_log(
        const std::string& log_id) const override;

    core::errors::Result<std::filesystem::path> write_log(
        const std::string& log_id,
        const std::vector<protocol::Message>& messages) const override;

    std::filesystem::path log_path(const std::string& log_id) const;
    std::filesystem::path backup_path(const std::string& log_id) const;

    static nlohmann::json message_to_json(const protocol::Message& message);
    static core::errors::Result<protocol::Message> message_from_json(
        const nlohmann::json& line, std::uint64_t sequence_index);

protected:
    // Materializes the full log into `temp_path`. Overridable so tests can
    // inject a failure part-way through the write.
    virtual core::errors::Result<bool> write_temp_file(
        const std::filesystem::path& temp_path,
        const std::vector<protocol::Message>& messages) const;

private:
    core::errors::Result<bool> validate_log_id(const std::string& log_id) const;

    std::filesystem::path root_;
    JsonlStoreOptions options_;
};

}  // namespace logcompact::store

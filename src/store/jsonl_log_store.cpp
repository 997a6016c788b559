#include "store/jsonl_log_store.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>
#include <utility>
#include "core/config/id_generator.hpp"
#include "core/logging/logger.hpp"

namespace logcompact::store {

using core::errors::CompactionError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::Log;
using protocol::Message;

namespace {

bool is_blank(const std::string& line) {
    return std::all_of(line.begin(), line.end(), [](const char c) {
        return c == ' ' || c == '\t' || c == '\r';
    });
}

}  // namespace

JsonlLogStore::JsonlLogStore(std::filesystem::path root, JsonlStoreOptions options)
    : root_(std::move(root)), options_(std::move(options)) {}

std::filesystem::path JsonlLogStore::log_path(const std::string& log_id) const {
    return root_ / log_id / options_.log_file_name;
}

std::filesystem::path JsonlLogStore::backup_path(const std::string& log_id) const {
    return root_ / log_id / options_.backup_file_name;
}

core::errors::Result<bool> JsonlLogStore::validate_log_id(
    const std::string& log_id) const {
    if (log_id.empty() || log_id == "." || log_id == ".." ||
        log_id.find('/') != std::string::npos ||
        log_id.find('\\') != std::string::npos) {
        return CompactionError{ErrorCategory::Input,
                               "Invalid log id: '" + log_id + "'",
                               "invalid_log_id",
                               "A log id is the name of a session directory."};
    }
    return true;
}

core::errors::Result<std::vector<std::string>> JsonlLogStore::list_logs() const {
    std::error_code ec;
    if (!std::filesystem::is_directory(root_, ec) || ec) {
        return CompactionError{ErrorCategory::StoreRead,
                               "Log store root is not a directory: " +
                                   root_.string(),
                               "invalid_store_root"};
    }

    std::vector<std::string> ids;
    std::filesystem::directory_iterator it(root_, ec);
    if (ec) {
        return CompactionError{ErrorCategory::StoreRead,
                               "Unable to list log store: " + root_.string(),
                               "store_list_failed"};
    }
    for (const std::filesystem::directory_iterator end{}; it != end; it.increment(ec)) {
        const auto& entry = *it;
        std::error_code entry_ec;
        if (!entry.is_directory(entry_ec) || entry_ec) {
            continue;
        }
        if (!std::filesystem::is_regular_file(entry.path() / options_.log_file_name,
                                              entry_ec) ||
            entry_ec) {
            continue;
        }
        ids.push_back(entry.path().filename().string());
    }
    if (ec) {
        return CompactionError{ErrorCategory::StoreRead,
                               "Unable to list log store: " + root_.string(),
                               "store_list_failed"};
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

json JsonlLogStore::message_to_json(const Message& message) {
    json payload = json::object();
    for (const auto& [key, value] : message.metadata) {
        payload[key] = value;
    }
    if (message.role.has_value()) {
        payload["role"] = protocol::to_string(message.role.value());
    }
    payload["content"] = message.content;
    return payload;
}

core::errors::Result<Message> JsonlLogStore::message_from_json(
    const json& line, const std::uint64_t sequence_index) {
    if (!line.is_object()) {
        return CompactionError{ErrorCategory::MalformedLog,
                               "Line " + std::to_string(sequence_index + 1) +
                                   " is not a JSON object.",
                               "invalid_message"};
    }

    Message message;
    message.sequence_index = sequence_index;
    for (const auto& [key, value] : line.items()) {
        if (key == "role") {
            const auto role = value.is_string()
                                  ? protocol::parse_role(value.get<std::string>())
                                  : std::optional<protocol::Role>{};
            if (!role.has_value()) {
                return CompactionError{ErrorCategory::MalformedLog,
                                       "Line " + std::to_string(sequence_index + 1) +
                                           " has an unknown role: " + value.dump(),
                                       "unknown_role"};
            }
            message.role = role;
        } else if (key == "content") {
            if (!value.is_string()) {
                return CompactionError{ErrorCategory::MalformedLog,
                                       "Line " + std::to_string(sequence_index + 1) +
                                           " has non-string content.",
                                       "invalid_content"};
            }
            message.content = value.get<std::string>();
        } else {
            message.metadata.emplace(key, value);
        }
    }

    if (!line.contains("content")) {
        return CompactionError{ErrorCategory::MalformedLog,
                               "Line " + std::to_string(sequence_index + 1) +
                                   " has no content.",
                               "missing_content"};
    }
    // A missing role is left empty here and rejected by the pipeline.
    return message;
}

core::errors::Result<Log> JsonlLogStore::read_log(const std::string& log_id) const {
    auto valid = validate_log_id(log_id);
    if (core::errors::is_error(valid)) {
        return core::errors::get_error(valid);
    }

    const auto path = log_path(log_id);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return CompactionError{ErrorCategory::StoreRead,
                               "Log not found: " + path.string(), "log_not_found"};
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        return CompactionError{ErrorCategory::StoreRead,
                               "Unable to open log: " + path.string(),
                               "log_open_failed"};
    }

    Log log;
    log.session_id = log_id;
    log.location = path;

    std::string line;
    std::uint64_t next_index = 0;
    while (std::getline(in, line)) {
        if (is_blank(line)) {
            continue;
        }
        const json parsed = json::parse(line, nullptr, false);
        if (parsed.is_discarded()) {
            return CompactionError{ErrorCategory::MalformedLog,
                                   "Log " + log_id + " line " +
                                       std::to_string(next_index + 1) +
                                       " is not valid JSON.",
                                   "invalid_json"};
        }
        auto message = message_from_json(parsed, next_index);
        if (core::errors::is_error(message)) {
            auto err = core::errors::get_error(message);
            err.message = "Log " + log_id + ": " + err.message;
            return err;
        }
        log.messages.push_back(std::move(core::errors::get_value(message)));
        ++next_index;
    }
    if (in.bad()) {
        return CompactionError{ErrorCategory::StoreRead,
                               "I/O error while reading log: " + path.string(),
                               "log_read_failed"};
    }

    LOG_DEBUG("JsonlLogStore: read " + std::to_string(log.messages.size()) +
              " messages from " + path.string());
    return log;
}

core::errors::Result<bool> JsonlLogStore::write_temp_file(
    const std::filesystem::path& temp_path,
    const std::vector<Message>& messages) const {
    std::ofstream out(temp_path, std::ios::trunc);
    if (!out.is_open()) {
        return CompactionError{ErrorCategory::StoreWrite,
                               "Unable to open temp file: " + temp_path.string(),
                               "temp_open_failed"};
    }

    try {
        for (const auto& message : messages) {
            out << message_to_json(message).dump() << "\n";
        }
    } catch (const json::type_error& e) {
        return CompactionError{ErrorCategory::StoreWrite,
                               "Unable to serialize message: " + std::string(e.what()),
                               "serialize_failed"};
    }

    out.close();
    if (out.fail()) {
        return CompactionError{ErrorCategory::StoreWrite,
                               "Unable to write temp file: " + temp_path.string(),
                               "temp_write_failed"};
    }
    return true;
}

core::errors::Result<std::filesystem::path> JsonlLogStore::write_log(
    const std::string& log_id, const std::vector<Message>& messages) const {
    auto valid = validate_log_id(log_id);
    if (core::errors::is_error(valid)) {
        return core::errors::get_error(valid);
    }

    const auto path = log_path(log_id);
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        return CompactionError{ErrorCategory::StoreWrite,
                               "Unable to create log directory: " +
                                   path.parent_path().string(),
                               "log_dir_create_failed"};
    }

    const auto temp_path =
        path.parent_path() /
        (options_.log_file_name + "." + core::config::generate_id("tmp"));
    auto discard_temp = [&temp_path]() {
        std::error_code remove_ec;
        std::filesystem::remove(temp_path, remove_ec);
    };

    auto written = write_temp_file(temp_path, messages);
    if (core::errors::is_error(written)) {
        discard_temp();
        return core::errors::get_error(written);
    }

    if (options_.keep_backup && std::filesystem::exists(path, ec)) {
        std::filesystem::copy_file(path, backup_path(log_id),
                                   std::filesystem::copy_options::overwrite_existing,
                                   ec);
        if (ec) {
            discard_temp();
            return CompactionError{ErrorCategory::StoreWrite,
                                   "Unable to back up log: " + path.string(),
                                   "backup_failed"};
        }
    }

    // Same directory, so the swap is a single atomic rename.
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        discard_temp();
        return CompactionError{ErrorCategory::StoreWrite,
                               "Unable to swap compacted log into place: " +
                                   path.string(),
                               "swap_failed"};
    }

    LOG_DEBUG("JsonlLogStore: wrote " + std::to_string(messages.size()) +
              " messages to " + path.string());
    return path;
}

}  // namespace logcompact::store

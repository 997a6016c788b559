#include "cli_parser.hpp"
#include <charconv>
#include <cstdint>
#include <optional>
#include <system_error>
#include <vector>

namespace logcompact::app::cli {

    using namespace logcompact::core::errors;
    using logcompact::protocol::CompactRequest;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> store;
        std::optional<std::string> session;
        bool all = false;
        std::optional<std::string> window;
        std::optional<std::string> delimiter;
        std::optional<std::string> jobs;
        std::optional<std::string> config_file;
        bool no_backup = false;
        bool json = false;
        bool verbose = false;
    };

    // Turns the two-character sequences \n, \t and \\ into the characters they name.
    std::string unescape_delimiter(const std::string& raw) {
        std::string out;
        for (size_t i = 0; i < raw.size(); ++i) {
            if (raw[i] == '\\' && i + 1 < raw.size()) {
                const char next = raw[i + 1];
                if (next == 'n') { out.push_back('\n'); ++i; continue; }
                if (next == 't') { out.push_back('\t'); ++i; continue; }
                if (next == '\\') { out.push_back('\\'); ++i; continue; }
            }
            out.push_back(raw[i]);
        }
        return out;
    }

    template <typename T>
    bool parse_number(const std::string& text, T& value) {
        const char* begin = text.data();
        const char* end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(begin, end, value);
        return ec == std::errc() && ptr == end;
    }

    Result<CompactRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return CompactionError{ErrorCategory::Input, "No command provided.", "missing_command", "Usage: logcompact compact --store DIR (--session ID | --all)"};
        }

        std::string command = argv[1];
        if (command != "compact") {
            return CompactionError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Currently only the 'compact' command is supported."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and 'compact' command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        auto take_value = [&args](size_t& i, std::optional<std::string>& slot) {
            if (i + 1 >= args.size()) return false;
            slot = args[++i];
            return true;
        };
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& flag = args[i];
            bool ok = true;
            if (flag == "--store") ok = take_value(i, raw.store);
            else if (flag == "--session") ok = take_value(i, raw.session);
            else if (flag == "--window") ok = take_value(i, raw.window);
            else if (flag == "--delimiter") ok = take_value(i, raw.delimiter);
            else if (flag == "--jobs") ok = take_value(i, raw.jobs);
            else if (flag == "--config") ok = take_value(i, raw.config_file);
            else if (flag == "--all") raw.all = true;
            else if (flag == "--no-backup") raw.no_backup = true;
            else if (flag == "--json") raw.json = true;
            else if (flag == "--verbose") raw.verbose = true;
            else return CompactionError{ErrorCategory::Input, "Unknown argument: " + flag, "unknown_argument"};

            if (!ok) {
                return CompactionError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        CompactRequest req;
        req.verbose = raw.verbose;
        req.json_output = raw.json;

        if (!raw.store.has_value()) {
            return CompactionError{ErrorCategory::Input, "Must provide --store", "missing_required_flag"};
        }

        // Mutual Exclusion XOR check
        if (!raw.session.has_value() && !raw.all) {
            return CompactionError{ErrorCategory::Input, "Must provide either --session or --all", "missing_required_flag"};
        }
        if (raw.session.has_value() && raw.all) {
            return CompactionError{ErrorCategory::Input, "Cannot provide both --session and --all", "conflicting_flags"};
        }
        req.session_id = raw.session;

        // Config file first, explicit flags override it
        if (raw.config_file) {
            auto loaded = core::config::load_config_file(raw.config_file.value());
            if (is_error(loaded)) {
                return get_error(loaded);
            }
            req.config = get_value(loaded);
        }

        // Range checks live in core::config::validate so every caller gets them
        if (raw.window) {
            int window = 0;
            if (!parse_number(raw.window.value(), window)) {
                return CompactionError{ErrorCategory::Input, "Invalid number for --window", "invalid_integer", "Provide a positive integer."};
            }
            req.config.window_size = window;
        }
        if (raw.jobs) {
            std::uint32_t jobs = 0;
            if (!parse_number(raw.jobs.value(), jobs)) {
                return CompactionError{ErrorCategory::Input, "Invalid number for --jobs", "invalid_integer", "Provide a positive integer."};
            }
            req.config.jobs = jobs;
        }
        if (raw.delimiter) req.config.merge_delimiter = unescape_delimiter(raw.delimiter.value());
        if (raw.no_backup) req.config.backup = false;

        // Path validation
        std::filesystem::path p(raw.store.value());
        std::error_code path_ec;
        const bool is_dir = std::filesystem::is_directory(p, path_ec);
        if (path_ec || !is_dir) {
            return CompactionError{ErrorCategory::Input, "Log store does not exist or is not a directory", "invalid_path"};
        }

        std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
        if (path_ec) {
            return CompactionError{ErrorCategory::Input, "Failed to canonicalize log store path", "invalid_path"};
        }
        req.store_root = std::move(canonical_path);

        return req;
    }

} // namespace logcompact::app::cli

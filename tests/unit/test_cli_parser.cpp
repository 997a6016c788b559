#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/config/id_generator.hpp"
#include "core/errors/compaction_errors.hpp"

namespace {

using logcompact::app::cli::parse_and_validate;
using logcompact::core::errors::ErrorCategory;
using logcompact::core::errors::get_error;
using logcompact::core::errors::get_value;
using logcompact::core::errors::is_error;
using logcompact::protocol::CompactRequest;

logcompact::core::errors::Result<CompactRequest> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("logcompact");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_and_validate(static_cast<int>(argv.size()), argv.data());
}

std::string cwd() { return std::filesystem::current_path().string(); }

TEST(CliParserTest, FailsWhenCommandMissing) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_command");
}

TEST(CliParserTest, FailsWhenCommandUnknown) {
    auto result = parse_tokens({"status"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
}

TEST(CliParserTest, FailsWhenStoreMissing) {
    auto result = parse_tokens({"compact", "--all"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

TEST(CliParserTest, FailsWhenScopeMissing) {
    auto result = parse_tokens({"compact", "--store", cwd()});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

TEST(CliParserTest, FailsWhenSessionAndAllBothProvided) {
    auto result = parse_tokens({"compact", "--store", cwd(), "--session", "s1", "--all"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "conflicting_flags");
}

TEST(CliParserTest, FailsWhenFlagValueMissing) {
    auto result = parse_tokens({"compact", "--all", "--store"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, FailsOnUnknownArgument) {
    auto result = parse_tokens({"compact", "--all", "--store", cwd(), "--fast"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, FailsWhenWindowNotNumeric) {
    auto result = parse_tokens({"compact", "--all", "--store", cwd(), "--window", "3x"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, LeavesWindowRangeToConfigValidation) {
    auto result = parse_tokens({"compact", "--all", "--store", cwd(), "--window", "0"});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).config.window_size, 0);
}

TEST(CliParserTest, FailsWhenStoreInvalid) {
    const auto missing_dir =
        std::filesystem::current_path() / "__definitely_missing_cli_parser_store__";
    auto result = parse_tokens({"compact", "--all", "--store", missing_dir.string()});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(CliParserTest, ParsesSessionRequestWithDefaults) {
    auto result = parse_tokens({"compact", "--store", cwd(), "--session", "2024-05-01-demo"});
    ASSERT_FALSE(is_error(result));

    const auto& req = get_value(result);
    ASSERT_TRUE(req.session_id.has_value());
    EXPECT_EQ(req.session_id.value(), "2024-05-01-demo");
    EXPECT_EQ(req.config.window_size, 3);
    EXPECT_EQ(req.config.merge_delimiter, "\n");
    EXPECT_EQ(req.config.jobs, 1u);
    EXPECT_TRUE(req.config.backup);
    EXPECT_FALSE(req.json_output);
    EXPECT_TRUE(std::filesystem::exists(req.store_root));
}

TEST(CliParserTest, ParsesBatchRequestWithOverrides) {
    auto result = parse_tokens({"compact", "--store", cwd(), "--all", "--window", "5",
                                "--delimiter", "\\n---\\n", "--jobs", "8", "--no-backup",
                                "--json", "--verbose"});
    ASSERT_FALSE(is_error(result));

    const auto& req = get_value(result);
    EXPECT_FALSE(req.session_id.has_value());
    EXPECT_EQ(req.config.window_size, 5);
    EXPECT_EQ(req.config.merge_delimiter, "\n---\n");
    EXPECT_EQ(req.config.jobs, 8u);
    EXPECT_FALSE(req.config.backup);
    EXPECT_TRUE(req.json_output);
    EXPECT_TRUE(req.verbose);
}

TEST(CliParserTest, FlagsOverrideConfigFile) {
    const auto config_path = std::filesystem::current_path() /
                             (".tmp_cli_config_" +
                              logcompact::core::config::generate_id("test") + ".json");
    {
        std::ofstream out(config_path);
        out << R"({"window_size": 7, "merge_delimiter": " | ", "jobs": 2})";
    }

    auto result = parse_tokens({"compact", "--store", cwd(), "--all", "--config",
                                config_path.string(), "--jobs", "3"});
    std::error_code ec;
    std::filesystem::remove(config_path, ec);

    ASSERT_FALSE(is_error(result));
    const auto& req = get_value(result);
    EXPECT_EQ(req.config.window_size, 7);
    EXPECT_EQ(req.config.merge_delimiter, " | ");
    EXPECT_EQ(req.config.jobs, 3u);
}

}  // namespace

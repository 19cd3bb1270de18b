#include <filesystem>
#include <string>
#include <utility>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/errors/store_errors.hpp"

namespace {

using runvault::app::cli::parse_and_validate;
using runvault::core::errors::ErrorCategory;
using runvault::core::errors::get_error;
using runvault::core::errors::get_value;
using runvault::core::errors::is_error;
using runvault::protocol::CliCommand;
using runvault::protocol::CliRequest;
using runvault::protocol::RunStatus;

runvault::core::errors::Result<CliRequest> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("runvault");
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

std::string error_code_for(const std::vector<std::string>& tokens) {
    auto result = parse_tokens(tokens);
    return is_error(result) ? get_error(result).code : "";
}

TEST(CliParserTest, FailsWhenCommandMissing) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_command");
    EXPECT_FALSE(get_error(result).hint.empty());

    EXPECT_EQ(error_code_for({"--verbose"}), "missing_command");
}

TEST(CliParserTest, FailsWhenCommandUnknown) {
    EXPECT_EQ(error_code_for({"prune"}), "unknown_command");
}

TEST(CliParserTest, FailsOnUnknownFlag) {
    EXPECT_EQ(error_code_for({"list", "--all"}), "unknown_argument");
}

TEST(CliParserTest, FailsWhenFlagValueMissing) {
    EXPECT_EQ(error_code_for({"list", "--flow"}), "missing_value");
    EXPECT_EQ(error_code_for({"usage", "--base-dir"}), "missing_value");
}

TEST(CliParserTest, ParsesCleanupWithGlobalOptions) {
    auto result = parse_tokens({"--base-dir", "/srv/store", "cleanup", "--dry-run", "-v"});
    ASSERT_FALSE(is_error(result));

    const auto& req = get_value(result);
    EXPECT_EQ(req.command, CliCommand::Cleanup);
    EXPECT_TRUE(req.dry_run);
    EXPECT_TRUE(req.verbose);
    ASSERT_TRUE(req.base_dir.has_value());
    EXPECT_EQ(req.base_dir->string(), "/srv/store");
    EXPECT_FALSE(req.config_path.has_value());
}

TEST(CliParserTest, GlobalOptionsMayFollowTheCommand) {
    auto result = parse_tokens({"cleanup-archives", "--config", "store.json", "--base-dir", "data"});
    ASSERT_FALSE(is_error(result));

    const auto& req = get_value(result);
    EXPECT_EQ(req.command, CliCommand::CleanupArchives);
    EXPECT_FALSE(req.dry_run);
    ASSERT_TRUE(req.config_path.has_value());
    EXPECT_EQ(req.config_path->string(), "store.json");
    ASSERT_TRUE(req.base_dir.has_value());
    EXPECT_EQ(req.base_dir->string(), "data");
}

TEST(CliParserTest, RejectsEmptyBaseDir) {
    EXPECT_EQ(error_code_for({"usage", "--base-dir", ""}), "invalid_path");
}

TEST(CliParserTest, ParsesRunIdCommands) {
    const std::vector<std::pair<std::string, CliCommand>> cases = {
        {"archive", CliCommand::Archive},
        {"restore", CliCommand::Restore},
        {"delete-archive", CliCommand::DeleteArchive},
        {"show", CliCommand::Show},
    };
    for (const auto& [name, command] : cases) {
        auto result = parse_tokens({name, "2026-10-01-impl-deadbeef"});
        ASSERT_FALSE(is_error(result)) << name;
        EXPECT_EQ(get_value(result).command, command) << name;
        EXPECT_EQ(get_value(result).run_id, "2026-10-01-impl-deadbeef") << name;

        EXPECT_EQ(error_code_for({name}), "missing_argument") << name;
        EXPECT_EQ(error_code_for({name, "a", "b"}), "unexpected_argument") << name;
    }
}

TEST(CliParserTest, CommandsWithoutArgumentsRejectPositionals) {
    EXPECT_EQ(error_code_for({"archives", "extra"}), "unexpected_argument");
    EXPECT_EQ(error_code_for({"stats", "extra"}), "unexpected_argument");

    auto usage = parse_tokens({"usage"});
    ASSERT_FALSE(is_error(usage));
    EXPECT_EQ(get_value(usage).command, CliCommand::Usage);
}

TEST(CliParserTest, ParsesShowMarkdown) {
    auto result = parse_tokens({"show", "--markdown", "run-1"});
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).markdown);
    EXPECT_EQ(get_value(result).run_id, "run-1");
}

TEST(CliParserTest, ParsesListFilters) {
    auto result = parse_tokens({"list", "--flow", "impl", "--status", "cancelled", "--limit", "25"});
    ASSERT_FALSE(is_error(result));

    const auto& req = get_value(result);
    EXPECT_EQ(req.command, CliCommand::List);
    EXPECT_EQ(req.flow_id, "impl");
    ASSERT_TRUE(req.status.has_value());
    EXPECT_EQ(req.status.value(), RunStatus::Canceled);
    EXPECT_EQ(req.limit, 25u);
}

TEST(CliParserTest, ListDefaultsAreUnfiltered) {
    auto result = parse_tokens({"list"});
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).flow_id.empty());
    EXPECT_FALSE(get_value(result).status.has_value());
    EXPECT_EQ(get_value(result).limit, 0u);
}

TEST(CliParserTest, FailsOnInvalidStatus) {
    EXPECT_EQ(error_code_for({"list", "--status", "done"}), "invalid_status");
}

TEST(CliParserTest, FailsWhenLimitNotNumeric) {
    EXPECT_EQ(error_code_for({"list", "--limit", "abc"}), "invalid_integer");
    EXPECT_EQ(error_code_for({"list", "--limit", "12abc"}), "invalid_integer");
    EXPECT_EQ(error_code_for({"list", "--limit", "-3"}), "invalid_integer");
}

TEST(CliParserTest, FailsWhenLimitOutOfBounds) {
    EXPECT_EQ(error_code_for({"list", "--limit", "1000001"}), "bounds_error");
}

TEST(CliParserTest, ParsesSearch) {
    auto result = parse_tokens({"search", "parser error", "--case-sensitive", "--max", "10"});
    ASSERT_FALSE(is_error(result));

    const auto& req = get_value(result);
    EXPECT_EQ(req.command, CliCommand::Search);
    EXPECT_EQ(req.query, "parser error");
    EXPECT_TRUE(req.case_sensitive);
    EXPECT_EQ(req.max_results, 10u);
}

TEST(CliParserTest, SearchQueryMayStartWithDashAfterSeparator) {
    auto result = parse_tokens({"search", "--", "--verbose"});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).query, "--verbose");
    EXPECT_FALSE(get_value(result).verbose);
}

TEST(CliParserTest, FailsOnEmptySearchQuery) {
    EXPECT_EQ(error_code_for({"search", ""}), "empty_query");
    EXPECT_EQ(error_code_for({"search"}), "missing_argument");
}

TEST(CliParserTest, RejectsFlagsForOtherCommands) {
    EXPECT_EQ(error_code_for({"list", "--dry-run"}), "conflicting_flags");
    EXPECT_EQ(error_code_for({"stats", "--flow", "impl"}), "conflicting_flags");
    EXPECT_EQ(error_code_for({"list", "--max", "3"}), "conflicting_flags");
    EXPECT_EQ(error_code_for({"search", "x", "--case-sensitive", "--limit", "3"}), "conflicting_flags");
    EXPECT_EQ(error_code_for({"list", "--markdown"}), "conflicting_flags");
}

}  // namespace

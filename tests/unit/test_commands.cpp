#include <cstdint>
#include <filesystem>
#include <sstream>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "app/commands.hpp"
#include "session/transcript_store.hpp"
#include "test_support.hpp"

namespace {

using runvault::app::run_command;
using runvault::core::config::StoreConfig;
using runvault::core::errors::get_error;
using runvault::core::errors::get_value;
using runvault::core::errors::is_error;
using runvault::protocol::CliCommand;
using runvault::protocol::CliRequest;
using runvault::protocol::RunStartInfo;
using runvault::protocol::RunStatus;
using runvault::protocol::Turn;
using runvault::protocol::TurnRole;
using runvault::session::TranscriptStore;
using runvault::testing::TempWorkspace;

class CommandsTest : public ::testing::Test {
protected:
    CommandsTest() : workspace_("commands") {
        config_.base_dir = workspace_.root();
    }

    void record_run(const std::string& run_id, const std::string& flow, RunStatus status) {
        TranscriptStore store(config_.base_dir);
        RunStartInfo info;
        info.flow_id = flow;
        ASSERT_FALSE(is_error(store.start_run(run_id, info)));
        Turn turn;
        turn.role = TurnRole::User;
        turn.content = "please refactor the tokenizer";
        turn.tokens_in = 10;
        ASSERT_FALSE(is_error(store.record_turn(run_id, turn)));
        ASSERT_FALSE(is_error(store.end_run(run_id, status)));
    }

    std::string run(const CliRequest& req) {
        std::ostringstream out;
        auto result = run_command(req, config_, out);
        EXPECT_FALSE(is_error(result)) << (is_error(result) ? get_error(result).message : "");
        return out.str();
    }

    TempWorkspace workspace_;
    StoreConfig config_;
};

TEST_F(CommandsTest, ListAndStatsReportRecordedRuns) {
    record_run("2026-10-01-impl-00000001", "impl", RunStatus::Completed);
    record_run("2026-10-01-review-00000002", "review", RunStatus::Failed);

    CliRequest list;
    list.command = CliCommand::List;
    const auto all = run(list);
    EXPECT_NE(all.find("2026-10-01-impl-00000001"), std::string::npos);
    EXPECT_NE(all.find("Total: 2 runs"), std::string::npos);

    list.flow_id = "review";
    const auto filtered = run(list);
    EXPECT_EQ(filtered.find("2026-10-01-impl-00000001"), std::string::npos);
    EXPECT_NE(filtered.find("Total: 1 runs"), std::string::npos);

    CliRequest stats;
    stats.command = CliCommand::Stats;
    const auto text = run(stats);
    EXPECT_NE(text.find("Total Runs:      2"), std::string::npos);
    EXPECT_NE(text.find("  Failed:        1"), std::string::npos);
}

TEST_F(CommandsTest, ShowRendersTextOrMarkdown) {
    record_run("2026-10-01-impl-00000001", "impl", RunStatus::Completed);

    CliRequest show;
    show.command = CliCommand::Show;
    show.run_id = "2026-10-01-impl-00000001";
    EXPECT_NE(run(show).find("[1] USER"), std::string::npos);

    show.markdown = true;
    EXPECT_EQ(run(show).rfind("# Transcript: 2026-10-01-impl-00000001", 0), 0u);

    show.run_id = "2026-10-01-impl-ffffffff";
    std::ostringstream out;
    auto missing = run_command(show, config_, out);
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "run_not_found");
}

TEST_F(CommandsTest, ArchiveRestoreAndDeleteArchive) {
    record_run("2026-10-01-impl-00000001", "impl", RunStatus::Completed);

    CliRequest archive;
    archive.command = CliCommand::Archive;
    archive.run_id = "2026-10-01-impl-00000001";
    EXPECT_NE(run(archive).find("2026-10-01-impl-00000001.tar.gz"), std::string::npos);

    CliRequest archives;
    archives.command = CliCommand::Archives;
    EXPECT_EQ(run(archives), "2026-10-01-impl-00000001\n");

    CliRequest restore;
    restore.command = CliCommand::Restore;
    restore.run_id = archive.run_id;
    run(restore);
    EXPECT_TRUE(std::filesystem::exists(workspace_.root() / "runs" / archive.run_id / "metadata.json"));

    CliRequest remove;
    remove.command = CliCommand::DeleteArchive;
    remove.run_id = archive.run_id;
    EXPECT_EQ(run(remove).rfind("Deleted archive ", 0), 0u);
    EXPECT_EQ(run(archives), "");
}

TEST_F(CommandsTest, UsageAndCleanupPrintJson) {
    record_run("2026-10-01-impl-00000001", "impl", RunStatus::Completed);

    CliRequest usage;
    usage.command = CliCommand::Usage;
    const auto report = nlohmann::json::parse(run(usage));
    EXPECT_EQ(report.at("runCount").get<int>(), 1);
    EXPECT_EQ(report.at("archiveCount").get<int>(), 0);
    EXPECT_EQ(report.at("totalSize").get<std::int64_t>(),
              report.at("activeSize").get<std::int64_t>() + report.at("archiveSize").get<std::int64_t>());

    CliRequest cleanup;
    cleanup.command = CliCommand::Cleanup;
    cleanup.dry_run = true;
    const auto result = nlohmann::json::parse(run(cleanup));
    EXPECT_TRUE(result.at("dryRun").get<bool>());
    EXPECT_EQ(result.at("kept").size(), 1u);
    EXPECT_TRUE(result.at("deleted").empty());
    EXPECT_TRUE(result.at("archived").empty());
}

}  // namespace

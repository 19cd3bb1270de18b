#include <chrono>
#include <string>
#include <gtest/gtest.h>
#include "session/transcript_view.hpp"

namespace {

using runvault::core::time::Clock;
using runvault::core::time::TimePoint;
using runvault::protocol::RunMeta;
using runvault::protocol::RunStatus;
using runvault::protocol::ToolCall;
using runvault::protocol::Transcript;
using runvault::protocol::Turn;
using runvault::protocol::TurnRole;
using namespace runvault::session;

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

Transcript sample_transcript() {
    const TimePoint started = Clock::now() - std::chrono::minutes(10);

    Transcript t;
    t.run_id = "2026-10-18-impl-0a1b2c3d";
    t.meta.run_id = t.run_id;
    t.meta.flow_id = "impl";
    t.meta.status = RunStatus::Completed;
    t.meta.started_at = started;
    t.meta.ended_at = started + std::chrono::seconds(125);
    t.meta.total_tokens_in = 120;
    t.meta.total_tokens_out = 130;
    t.meta.total_cost = 0.25;
    t.meta.turn_count = 2;

    Turn user;
    user.id = 1;
    user.role = TurnRole::User;
    user.content = std::string(150, 'q') + "\nsecond line";
    user.tokens_in = 120;
    user.timestamp = started;
    t.turns.push_back(user);

    Turn assistant;
    assistant.id = 2;
    assistant.role = TurnRole::Assistant;
    assistant.content = "Reading the file.";
    assistant.tokens_out = 130;
    assistant.timestamp = started + std::chrono::seconds(5);
    ToolCall call;
    call.id = "call-1";
    call.name = "read_file";
    call.input = {{"path", "src/main.cpp"}};
    call.output = std::string(250, 'o');
    call.error = "partial read";
    assistant.tool_calls.push_back(call);
    t.turns.push_back(assistant);
    return t;
}

TEST(TranscriptViewTest, SummaryShowsHeaderAndTruncatedPreviews) {
    const auto text = render_summary(sample_transcript());

    EXPECT_TRUE(contains(text, std::string(60, '=')));
    EXPECT_TRUE(contains(text, "Run: 2026-10-18-impl-0a1b2c3d"));
    EXPECT_TRUE(contains(text, "Flow: impl | Status: completed"));
    EXPECT_TRUE(contains(text, "Duration: 2m5s"));
    EXPECT_TRUE(contains(text, "Tokens: 120 in / 130 out | Cost: $0.25"));
    EXPECT_TRUE(contains(text, "  [1] user: " + std::string(100, 'q') + "...\n"));
    EXPECT_TRUE(contains(text, "  [2] assistant: Reading the file.\n"));
    EXPECT_FALSE(contains(text, "second line"));
}

TEST(TranscriptViewTest, SummaryPreviewFlattensNewlines) {
    auto t = sample_transcript();
    t.turns[0].content = "first\nsecond";
    const auto text = render_summary(t);
    EXPECT_TRUE(contains(text, "  [1] user: first second\n"));
}

TEST(TranscriptViewTest, FullRenderIncludesTurnsAndToolCalls) {
    const auto text = render_full(sample_transcript());

    EXPECT_TRUE(contains(text, "[1] USER ("));
    EXPECT_TRUE(contains(text, "[120 tokens in]"));
    EXPECT_TRUE(contains(text, "[2] ASSISTANT ("));
    EXPECT_TRUE(contains(text, "[130 tokens out]"));
    EXPECT_TRUE(contains(text, "second line"));
    EXPECT_TRUE(contains(text, "  Tool: read_file\n"));
    EXPECT_TRUE(contains(text, "     Input: {\"path\":\"src/main.cpp\"}\n"));
    EXPECT_TRUE(contains(text, "     Output: " + std::string(200, 'o') + "...\n"));
    EXPECT_FALSE(contains(text, std::string(201, 'o')));
    EXPECT_TRUE(contains(text, "     Error: partial read\n"));
}

TEST(TranscriptViewTest, HeaderShowsRunError) {
    auto t = sample_transcript();
    t.meta.status = RunStatus::Failed;
    t.meta.error = "model quota exhausted";
    const auto text = render_full(t);
    EXPECT_TRUE(contains(text, "Status: failed"));
    EXPECT_TRUE(contains(text, "Error: model quota exhausted\n"));
}

TEST(TranscriptViewTest, MarkdownExport) {
    const auto md = export_markdown(sample_transcript());

    EXPECT_EQ(md.rfind("# Transcript: 2026-10-18-impl-0a1b2c3d\n", 0), 0u);
    EXPECT_TRUE(contains(md, "## Metadata\n"));
    EXPECT_TRUE(contains(md, "| Flow | impl |\n"));
    EXPECT_TRUE(contains(md, "| Status | completed |\n"));
    EXPECT_TRUE(contains(md, "| Ended | "));
    EXPECT_TRUE(contains(md, "| Duration | 2m5s |\n"));
    EXPECT_TRUE(contains(md, "| Cost | $0.25 |\n"));
    EXPECT_TRUE(contains(md, "## Conversation\n"));
    EXPECT_TRUE(contains(md, "### User (Turn 1)\n"));
    EXPECT_TRUE(contains(md, "### Assistant (Turn 2)\n"));
    EXPECT_TRUE(contains(md, "#### Tool Call: `read_file`\n"));
    EXPECT_TRUE(contains(md, "**Output:**\n```\n" + std::string(250, 'o') + "\n```\n"));
    EXPECT_TRUE(contains(md, "**Error:** partial read\n"));
}

TEST(TranscriptViewTest, MarkdownOmitsEndForRunningRuns) {
    auto t = sample_transcript();
    t.meta.status = RunStatus::Running;
    t.meta.ended_at = TimePoint{};
    const auto md = export_markdown(t);
    EXPECT_TRUE(contains(md, "| Status | running |\n"));
    EXPECT_FALSE(contains(md, "| Ended | "));
}

TEST(TranscriptViewTest, MetaListTable) {
    EXPECT_EQ(format_meta_list({}), "No runs found.\n");

    auto first = sample_transcript().meta;
    auto second = first;
    second.run_id = "2026-10-18-review-00ff00ff";
    second.status = RunStatus::Running;
    second.total_cost = 1.5;

    const auto table = format_meta_list({first, second});
    EXPECT_EQ(table.rfind("RUN ID", 0), 0u);
    EXPECT_TRUE(contains(table, "2026-10-18-impl-0a1b2c3d"));
    EXPECT_TRUE(contains(table, "2026-10-18-review-00ff00ff"));
    EXPECT_TRUE(contains(table, "120/130"));
    EXPECT_TRUE(contains(table, "$1.50"));
    EXPECT_TRUE(contains(table, "\nTotal: 2 runs\n"));
}

TEST(TranscriptViewTest, StatsText) {
    RunStatistics stats;
    stats.total_runs = 4;
    stats.completed_runs = 2;
    stats.failed_runs = 1;
    stats.active_runs = 1;
    stats.total_tokens_in = 400;
    stats.total_tokens_out = 200;
    stats.avg_tokens_in = 100;
    stats.avg_tokens_out = 50;
    stats.total_cost = 1.234;
    stats.avg_cost = 0.3085;

    const auto text = format_stats(stats);
    EXPECT_EQ(text.rfind("Run Statistics:\n", 0), 0u);
    EXPECT_TRUE(contains(text, "Total Runs:      4\n"));
    EXPECT_TRUE(contains(text, "  Failed:        1\n"));
    EXPECT_TRUE(contains(text, "Total Tokens:    400 in / 200 out\n"));
    EXPECT_TRUE(contains(text, "Avg Tokens/Run:  100 in / 50 out\n"));
    EXPECT_TRUE(contains(text, "Total Cost:      $1.23\n"));
    EXPECT_TRUE(contains(text, "Avg Cost/Run:    $0.31\n"));
}

TEST(TranscriptViewTest, RunDurationFormatting) {
    RunMeta meta;
    meta.started_at = Clock::now() - std::chrono::hours(5);

    meta.ended_at = meta.started_at + std::chrono::seconds(45);
    EXPECT_EQ(format_run_duration(meta), "45s");

    meta.ended_at = meta.started_at + std::chrono::milliseconds(124600);
    EXPECT_EQ(format_run_duration(meta), "2m5s");

    meta.ended_at = meta.started_at + std::chrono::seconds(3723);
    EXPECT_EQ(format_run_duration(meta), "1h2m3s");

    meta.ended_at = meta.started_at + std::chrono::hours(2);
    EXPECT_EQ(format_run_duration(meta), "2h0m0s");
}

}  // namespace

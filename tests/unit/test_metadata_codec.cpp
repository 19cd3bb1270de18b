#include <chrono>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "session/metadata_codec.hpp"
#include "test_support.hpp"

namespace {

using runvault::core::errors::ErrorCategory;
using runvault::core::errors::get_error;
using runvault::core::errors::get_value;
using runvault::core::errors::is_error;
using runvault::protocol::RunMeta;
using runvault::protocol::RunStatus;
using runvault::protocol::Transcript;
using runvault::protocol::Turn;
using runvault::protocol::TurnRole;
using namespace runvault::session;
using nlohmann::json;

runvault::core::time::TimePoint at_millis(std::int64_t ms) {
    return runvault::core::time::TimePoint(std::chrono::milliseconds(ms));
}

RunMeta sample_meta() {
    RunMeta meta;
    meta.run_id = "2025-01-15-impl-0a1b2c3d";
    meta.flow_id = "impl";
    meta.node_id = "coder";
    meta.input = json{{"ticket", "ABC-1"}};
    meta.status = RunStatus::Completed;
    meta.started_at = at_millis(1736935200125);
    meta.ended_at = at_millis(1736935260500);
    meta.total_tokens_in = 120;
    meta.total_tokens_out = 130;
    meta.total_cost = 0.25;
    meta.turn_count = 2;
    return meta;
}

TEST(MetadataCodecTest, EncodesCamelCaseKeysAndOmitsEmptyOptionals) {
    RunMeta meta = sample_meta();
    meta.ended_at = {};
    meta.status = RunStatus::Running;
    meta.node_id.clear();

    const json doc = meta_to_json(meta);
    EXPECT_EQ(doc.at("runId"), "2025-01-15-impl-0a1b2c3d");
    EXPECT_EQ(doc.at("flowId"), "impl");
    EXPECT_EQ(doc.at("status"), "running");
    EXPECT_EQ(doc.at("startedAt"), "2025-01-15T10:00:00.125Z");
    EXPECT_EQ(doc.at("totalTokensIn"), 120);
    EXPECT_EQ(doc.at("totalTokensOut"), 130);
    EXPECT_FALSE(doc.contains("endedAt"));
    EXPECT_FALSE(doc.contains("nodeId"));
    EXPECT_FALSE(doc.contains("error"));
}

TEST(MetadataCodecTest, DecodesWhatItEncodes) {
    const RunMeta meta = sample_meta();
    auto decoded = decode_metadata(encode_metadata(meta));
    ASSERT_FALSE(is_error(decoded));
    const RunMeta& back = get_value(decoded);
    EXPECT_EQ(back.run_id, meta.run_id);
    EXPECT_EQ(back.node_id, "coder");
    EXPECT_EQ(back.input, meta.input);
    EXPECT_EQ(back.status, RunStatus::Completed);
    EXPECT_EQ(back.started_at, meta.started_at);
    EXPECT_EQ(back.ended_at, meta.ended_at);
    EXPECT_DOUBLE_EQ(back.total_cost, 0.25);
    EXPECT_EQ(back.turn_count, 2);
}

TEST(MetadataCodecTest, AcceptsBritishSpellingOfCanceled) {
    auto decoded = decode_metadata(R"({"runId": "r", "status": "cancelled", "startedAt": "2025-01-01T00:00:00Z"})");
    ASSERT_FALSE(is_error(decoded));
    EXPECT_EQ(get_value(decoded).status, RunStatus::Canceled);
}

TEST(MetadataCodecTest, NullOrZeroEndedAtReadsAsUnset) {
    auto null_end = decode_metadata(R"({"runId": "r", "status": "running", "endedAt": null})");
    ASSERT_FALSE(is_error(null_end));
    EXPECT_FALSE(get_value(null_end).has_ended());

    auto zero_end = decode_metadata(R"({"runId": "r", "status": "running", "endedAt": "0001-01-01T00:00:00Z"})");
    ASSERT_FALSE(is_error(zero_end));
    EXPECT_FALSE(get_value(zero_end).has_ended());
}

TEST(MetadataCodecTest, RejectsMissingOrUnknownStatus) {
    for (const std::string text : {
             R"({"runId": "r"})",
             R"({"runId": "r", "status": "paused"})",
             R"({"runId": "r", "status": 3})",
             R"({"runId": "r", "status": "completed", "startedAt": "yesterday"})",
             R"(not json)"}) {
        auto decoded = decode_metadata(text);
        ASSERT_TRUE(is_error(decoded)) << text;
        EXPECT_EQ(get_error(decoded).category, ErrorCategory::Io) << text;
        EXPECT_EQ(get_error(decoded).code, "invalid_metadata") << text;
    }
}

TEST(MetadataCodecTest, TranscriptCarriesTurnsAndToolCalls) {
    Transcript transcript;
    transcript.run_id = "run-1";
    transcript.meta = sample_meta();
    transcript.meta.run_id = "run-1";

    Turn user;
    user.id = 1;
    user.role = TurnRole::User;
    user.content = "Implement the parser";
    user.tokens_in = 100;
    user.timestamp = at_millis(1736935201000);

    Turn assistant;
    assistant.id = 2;
    assistant.role = TurnRole::Assistant;
    assistant.content = "Reading files";
    assistant.tokens_out = 130;
    assistant.timestamp = at_millis(1736935202000);
    assistant.duration_ms = 850;
    runvault::protocol::ToolCall call;
    call.id = "call-1";
    call.name = "read_file";
    call.input = json{{"path", "src/main.cpp"}};
    call.error = "permission denied";
    assistant.tool_calls.push_back(call);

    transcript.turns = {user, assistant};

    const json doc = transcript_to_json(transcript);
    EXPECT_FALSE(doc.at("turns").at(0).contains("toolCalls"));
    EXPECT_FALSE(doc.at("turns").at(0).contains("tokensOut"));
    EXPECT_EQ(doc.at("turns").at(1).at("toolCalls").at(0).at("error"), "permission denied");

    auto decoded = decode_transcript(encode_transcript(transcript));
    ASSERT_FALSE(is_error(decoded));
    const Transcript& back = get_value(decoded);
    EXPECT_EQ(back.run_id, "run-1");
    ASSERT_EQ(back.turns.size(), 2u);
    EXPECT_EQ(back.turns[0].role, TurnRole::User);
    EXPECT_EQ(back.turns[0].tokens_in, 100);
    EXPECT_FALSE(back.turns[0].duration_ms.has_value());
    EXPECT_EQ(back.turns[1].role, TurnRole::Assistant);
    EXPECT_EQ(back.turns[1].duration_ms.value_or(0), 850);
    ASSERT_EQ(back.turns[1].tool_calls.size(), 1u);
    EXPECT_EQ(back.turns[1].tool_calls[0].name, "read_file");
    EXPECT_EQ(back.turns[1].tool_calls[0].input.at("path"), "src/main.cpp");
    EXPECT_EQ(back.turns[1].tool_calls[0].error, "permission denied");
}

TEST(MetadataCodecTest, RejectsUnknownTurnRole) {
    auto decoded = decode_transcript(R"({
        "runId": "r",
        "metadata": {"runId": "r", "status": "completed"},
        "turns": [{"id": 1, "role": "narrator", "content": "hi"}]
    })");
    ASSERT_TRUE(is_error(decoded));
    EXPECT_EQ(get_error(decoded).code, "invalid_transcript");
}

TEST(MetadataCodecTest, WritesAndReadsMetadataFile) {
    runvault::testing::TempWorkspace workspace("metadata");
    const auto run_dir = workspace.root() / "run-1";
    std::filesystem::create_directories(run_dir);

    auto written = write_metadata(run_dir, sample_meta());
    ASSERT_FALSE(is_error(written));
    EXPECT_EQ(get_value(written).string(), (run_dir / kMetadataFile).string());

    auto read = read_metadata(run_dir);
    ASSERT_FALSE(is_error(read));
    EXPECT_EQ(get_value(read).flow_id, "impl");

    auto missing = read_metadata(workspace.root() / "absent");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).category, ErrorCategory::NotFound);
}

}  // namespace

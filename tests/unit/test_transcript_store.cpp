#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "session/artifact_manager.hpp"
#include "session/transcript_store.hpp"
#include "test_support.hpp"

namespace {

using runvault::core::errors::ErrorCategory;
using runvault::core::errors::get_error;
using runvault::core::errors::get_value;
using runvault::core::errors::is_error;
using runvault::protocol::RunStartInfo;
using runvault::protocol::RunStatus;
using runvault::protocol::ToolCall;
using runvault::protocol::Turn;
using runvault::protocol::TurnRole;
using runvault::session::ListFilter;
using runvault::session::TranscriptStore;
using runvault::testing::TempWorkspace;

RunStartInfo start_info(const std::string& flow) {
    RunStartInfo info;
    info.flow_id = flow;
    info.node_id = "coder";
    info.input = nlohmann::json{{"task", "implement parser"}};
    return info;
}

Turn make_turn(TurnRole role, const std::string& content, std::int64_t in, std::int64_t out) {
    Turn turn;
    turn.role = role;
    turn.content = content;
    turn.tokens_in = in;
    turn.tokens_out = out;
    return turn;
}

TEST(TranscriptStoreTest, StartWritesRunningMetadata) {
    TempWorkspace workspace("transcripts");
    TranscriptStore store(workspace.root());

    auto started = store.start_run("run-1", start_info("impl"));
    ASSERT_FALSE(is_error(started));
    EXPECT_EQ(get_value(started).status, RunStatus::Running);
    EXPECT_FALSE(get_value(started).has_ended());
    EXPECT_TRUE(std::filesystem::exists(workspace.root() / "runs" / "run-1" / "metadata.json"));
    EXPECT_EQ(store.list_active(), std::vector<std::string>{"run-1"});

    auto duplicate = store.start_run("run-1", start_info("impl"));
    ASSERT_TRUE(is_error(duplicate));
    EXPECT_EQ(get_error(duplicate).category, ErrorCategory::AlreadyExists);
    EXPECT_EQ(get_error(duplicate).code, "run_already_exists");
}

TEST(TranscriptStoreTest, AccumulatesTokensByRole) {
    TempWorkspace workspace("transcripts");
    TranscriptStore store(workspace.root());
    ASSERT_FALSE(is_error(store.start_run("run-1", start_info("impl"))));

    // Input tokens count for user and system turns, output tokens for assistant turns.
    ASSERT_FALSE(is_error(store.record_turn("run-1", make_turn(TurnRole::System, "rules", 20, 999))));
    ASSERT_FALSE(is_error(store.record_turn("run-1", make_turn(TurnRole::User, "do it", 100, 5))));
    ASSERT_FALSE(is_error(store.record_turn("run-1", make_turn(TurnRole::Assistant, "done", 7, 130))));
    ASSERT_FALSE(is_error(store.record_turn("run-1", make_turn(TurnRole::ToolResult, "ok", 50, 50))));

    auto meta = store.load_metadata("run-1");
    ASSERT_FALSE(is_error(meta));
    EXPECT_EQ(get_value(meta).total_tokens_in, 120);
    EXPECT_EQ(get_value(meta).total_tokens_out, 130);
    EXPECT_EQ(get_value(meta).turn_count, 4);
}

TEST(TranscriptStoreTest, RecordsTurnsAndEndsRun) {
    TempWorkspace workspace("transcripts");
    TranscriptStore store(workspace.root());
    ASSERT_FALSE(is_error(store.start_run("run-1", start_info("impl"))));

    auto first = store.record_turn("run-1", make_turn(TurnRole::User, "Implement it", 100, 0));
    ASSERT_FALSE(is_error(first));
    EXPECT_EQ(get_value(first), 1);
    auto second = store.record_turn("run-1", make_turn(TurnRole::Assistant, "Reading", 0, 130));
    ASSERT_FALSE(is_error(second));
    EXPECT_EQ(get_value(second), 2);

    ToolCall call;
    call.id = "call-1";
    call.name = "read_file";
    call.input = nlohmann::json{{"path", "main.go"}};
    call.output = "package main";
    auto attached = store.record_tool_call("run-1", call);
    ASSERT_FALSE(is_error(attached));
    EXPECT_EQ(get_value(attached), 1u);

    auto cost = store.add_cost("run-1", 0.125);
    ASSERT_FALSE(is_error(cost));
    auto total = store.add_cost("run-1", 0.125);
    ASSERT_FALSE(is_error(total));
    EXPECT_DOUBLE_EQ(get_value(total), 0.25);

    auto ended = store.end_run("run-1", RunStatus::Completed);
    ASSERT_FALSE(is_error(ended));
    EXPECT_EQ(get_value(ended).status, RunStatus::Completed);
    EXPECT_TRUE(get_value(ended).has_ended());
    EXPECT_TRUE(store.list_active().empty());

    const auto dir = workspace.root() / "runs" / "run-1";
    EXPECT_TRUE(std::filesystem::exists(dir / "transcript.json"));
    EXPECT_FALSE(std::filesystem::exists(dir / "transcript.json.gz"));

    auto loaded = store.load("run-1");
    ASSERT_FALSE(is_error(loaded));
    const auto& transcript = get_value(loaded);
    EXPECT_EQ(transcript.meta.status, RunStatus::Completed);
    EXPECT_EQ(transcript.meta.flow_id, "impl");
    EXPECT_EQ(transcript.meta.input.at("task"), "implement parser");
    EXPECT_DOUBLE_EQ(transcript.meta.total_cost, 0.25);
    ASSERT_EQ(transcript.turns.size(), 2u);
    EXPECT_EQ(transcript.turns[1].tool_calls.size(), 1u);
    EXPECT_EQ(transcript.turns[1].tool_calls[0].output, "package main");
    EXPECT_NE(transcript.turns[0].timestamp, runvault::core::time::TimePoint{});

    auto meta = store.load_metadata("run-1");
    ASSERT_FALSE(is_error(meta));
    EXPECT_EQ(get_value(meta).turn_count, 2);
    EXPECT_EQ(get_value(meta).status, RunStatus::Completed);
}

TEST(TranscriptStoreTest, RejectsWritesToInactiveRuns) {
    TempWorkspace workspace("transcripts");
    TranscriptStore store(workspace.root());

    auto never = store.record_turn("ghost", make_turn(TurnRole::User, "hi", 1, 0));
    ASSERT_TRUE(is_error(never));
    EXPECT_EQ(get_error(never).category, ErrorCategory::InvalidState);
    EXPECT_EQ(get_error(never).code, "run_not_started");

    ASSERT_FALSE(is_error(store.start_run("run-1", start_info("impl"))));
    ASSERT_FALSE(is_error(store.end_run("run-1", RunStatus::Canceled)));

    auto after_end = store.record_turn("run-1", make_turn(TurnRole::User, "late", 1, 0));
    ASSERT_TRUE(is_error(after_end));
    EXPECT_EQ(get_error(after_end).code, "run_not_started");

    auto end_twice = store.end_run("run-1", RunStatus::Completed);
    ASSERT_TRUE(is_error(end_twice));
    EXPECT_EQ(get_error(end_twice).code, "run_not_started");

    auto cost = store.add_cost("run-1", 1.0);
    ASSERT_TRUE(is_error(cost));
    EXPECT_EQ(get_error(cost).code, "run_not_started");
}

TEST(TranscriptStoreTest, ToolCallNeedsAssistantTurn) {
    TempWorkspace workspace("transcripts");
    TranscriptStore store(workspace.root());
    ASSERT_FALSE(is_error(store.start_run("run-1", start_info("impl"))));

    ToolCall call;
    call.name = "grep";
    auto empty = store.record_tool_call("run-1", call);
    ASSERT_TRUE(is_error(empty));
    EXPECT_EQ(get_error(empty).code, "no_turns");

    ASSERT_FALSE(is_error(store.record_turn("run-1", make_turn(TurnRole::User, "hi", 1, 0))));
    auto wrong_role = store.record_tool_call("run-1", call);
    ASSERT_TRUE(is_error(wrong_role));
    EXPECT_EQ(get_error(wrong_role).category, ErrorCategory::InvalidState);
    EXPECT_EQ(get_error(wrong_role).code, "invalid_state");
}

TEST(TranscriptStoreTest, RejectsBadCostAndRunningEndStatus) {
    TempWorkspace workspace("transcripts");
    TranscriptStore store(workspace.root());
    ASSERT_FALSE(is_error(store.start_run("run-1", start_info("impl"))));

    auto negative = store.add_cost("run-1", -0.5);
    ASSERT_TRUE(is_error(negative));
    EXPECT_EQ(get_error(negative).code, "invalid_cost");

    auto running = store.end_run("run-1", RunStatus::Running);
    ASSERT_TRUE(is_error(running));
    EXPECT_EQ(get_error(running).code, "invalid_status");
    EXPECT_EQ(store.list_active(), std::vector<std::string>{"run-1"});
}

TEST(TranscriptStoreTest, EndWithErrorMarksFailure) {
    TempWorkspace workspace("transcripts");
    TranscriptStore store(workspace.root());
    ASSERT_FALSE(is_error(store.start_run("run-1", start_info("impl"))));

    auto ended = store.end_run_with_error("run-1", "model timed out");
    ASSERT_FALSE(is_error(ended));
    EXPECT_EQ(get_value(ended).status, RunStatus::Failed);
    EXPECT_EQ(get_value(ended).error, "model timed out");

    auto loaded = store.load("run-1");
    ASSERT_FALSE(is_error(loaded));
    EXPECT_EQ(get_value(loaded).meta.error, "model timed out");
    EXPECT_TRUE(get_value(loaded).turns.empty());
}

TEST(TranscriptStoreTest, ConcurrentTurnsGetContiguousIds) {
    TempWorkspace workspace("transcripts");
    TranscriptStore store(workspace.root());
    ASSERT_FALSE(is_error(store.start_run("run-1", start_info("impl"))));
    ASSERT_FALSE(is_error(store.start_run("run-2", start_info("review"))));

    constexpr int kThreads = 8;
    constexpr int kTurnsPerThread = 25;
    std::vector<std::thread> workers;
    std::vector<std::vector<int>> ids(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&store, &ids, t]() {
            const std::string run_id = (t % 2 == 0) ? "run-1" : "run-2";
            for (int i = 0; i < kTurnsPerThread; ++i) {
                auto id = store.record_turn(run_id, make_turn(TurnRole::User, "turn", 1, 0));
                if (!is_error(id)) {
                    ids[t].push_back(get_value(id));
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    for (const std::string run_id : {"run-1", "run-2"}) {
        auto ended = store.end_run(run_id, RunStatus::Completed);
        ASSERT_FALSE(is_error(ended));
        EXPECT_EQ(get_value(ended).turn_count, kThreads / 2 * kTurnsPerThread);
        EXPECT_EQ(get_value(ended).total_tokens_in, kThreads / 2 * kTurnsPerThread);

        auto loaded = store.load(run_id);
        ASSERT_FALSE(is_error(loaded));
        const auto& turns = get_value(loaded).turns;
        ASSERT_EQ(turns.size(), static_cast<std::size_t>(kThreads / 2 * kTurnsPerThread));
        for (std::size_t i = 0; i < turns.size(); ++i) {
            EXPECT_EQ(turns[i].id, static_cast<int>(i) + 1);
        }
    }
    for (const auto& per_thread : ids) {
        EXPECT_EQ(per_thread.size(), static_cast<std::size_t>(kTurnsPerThread));
        EXPECT_TRUE(std::is_sorted(per_thread.begin(), per_thread.end()));
    }
}

TEST(TranscriptStoreTest, TurnsRacingEndRunArePersistedOrRejected) {
    TempWorkspace workspace("transcripts");
    TranscriptStore store(workspace.root());
    ASSERT_FALSE(is_error(store.start_run("run-1", start_info("impl"))));

    constexpr int kThreads = 4;
    std::atomic<int> recorded{0};
    std::atomic<bool> go{false};
    std::vector<std::string> failure_codes[kThreads];
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&, t]() {
            while (!go.load()) {
                std::this_thread::yield();
            }
            for (int i = 0; i < 100000; ++i) {
                auto id = store.record_turn("run-1", make_turn(TurnRole::User, "turn", 1, 0));
                if (is_error(id)) {
                    failure_codes[t].push_back(get_error(id).code);
                    break;
                }
                ++recorded;
            }
        });
    }
    go = true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    auto ended = store.end_run("run-1", RunStatus::Completed);
    for (auto& worker : workers) {
        worker.join();
    }
    ASSERT_FALSE(is_error(ended));

    for (const auto& codes : failure_codes) {
        for (const auto& code : codes) {
            EXPECT_EQ(code, "run_not_started");
        }
    }
    EXPECT_EQ(get_value(ended).turn_count, recorded.load());

    TranscriptStore fresh(workspace.root());
    auto loaded = fresh.load("run-1");
    ASSERT_FALSE(is_error(loaded));
    EXPECT_EQ(get_value(loaded).turns.size(), static_cast<std::size_t>(recorded.load()));
    EXPECT_EQ(get_value(loaded).meta.turn_count, recorded.load());
}

TEST(TranscriptStoreTest, ConcurrentStartsOfOneIdHaveOneWinner) {
    TempWorkspace workspace("transcripts");
    TranscriptStore store(workspace.root());

    constexpr int kThreads = 8;
    std::atomic<int> started{0};
    std::atomic<int> duplicates{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&]() {
            auto result = store.start_run("run-1", start_info("impl"));
            if (!is_error(result)) {
                ++started;
            } else if (get_error(result).code == "run_already_exists") {
                ++duplicates;
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    EXPECT_EQ(started.load(), 1);
    EXPECT_EQ(duplicates.load(), kThreads - 1);
    EXPECT_EQ(store.list_active(), std::vector<std::string>{"run-1"});
}

TEST(TranscriptStoreTest, LoadOfActiveRunIsAnIndependentSnapshot) {
    TempWorkspace workspace("transcripts");
    TranscriptStore store(workspace.root());
    ASSERT_FALSE(is_error(store.start_run("run-1", start_info("impl"))));
    ASSERT_FALSE(is_error(store.record_turn("run-1", make_turn(TurnRole::User, "first", 10, 0))));
    ASSERT_FALSE(is_error(store.add_cost("run-1", 0.5)));

    auto snapshot = store.load("run-1");
    ASSERT_FALSE(is_error(snapshot));

    ASSERT_FALSE(is_error(store.record_turn("run-1", make_turn(TurnRole::Assistant, "second", 0, 5))));
    ASSERT_FALSE(is_error(store.add_cost("run-1", 0.25)));

    const auto& before = get_value(snapshot);
    ASSERT_EQ(before.turns.size(), 1u);
    EXPECT_EQ(before.turns[0].content, "first");
    EXPECT_EQ(before.meta.turn_count, 1);
    EXPECT_DOUBLE_EQ(before.meta.total_cost, 0.5);

    auto now = store.load("run-1");
    ASSERT_FALSE(is_error(now));
    EXPECT_EQ(get_value(now).turns.size(), 2u);
    EXPECT_DOUBLE_EQ(get_value(now).meta.total_cost, 0.75);
}

TEST(TranscriptStoreTest, InvalidUtf8IsReplacedOnPersist) {
    TempWorkspace workspace("transcripts");
    TranscriptStore store(workspace.root());
    ASSERT_FALSE(is_error(store.start_run("run-1", start_info("impl\xc3"))));

    ASSERT_FALSE(is_error(store.record_turn("run-1", make_turn(TurnRole::Assistant, "calling tool", 0, 3))));
    ToolCall call;
    call.id = "call-1";
    call.name = "cat";
    call.output = "raw \x80 bytes";
    ASSERT_FALSE(is_error(store.record_tool_call("run-1", call)));
    ASSERT_FALSE(is_error(store.record_turn("run-1", make_turn(TurnRole::ToolResult, "bin\xff\xfe", 0, 0))));

    auto ended = store.end_run_with_error("run-1", "exit \xfe");
    ASSERT_FALSE(is_error(ended));
    EXPECT_TRUE(store.list_active().empty());

    TranscriptStore fresh(workspace.root());
    auto loaded = fresh.load("run-1");
    ASSERT_FALSE(is_error(loaded));
    const auto& transcript = get_value(loaded);
    ASSERT_EQ(transcript.turns.size(), 2u);
    const std::string replacement = "\xEF\xBF\xBD";
    EXPECT_EQ(transcript.turns[1].content.rfind("bin" + replacement, 0), 0u);
    EXPECT_NE(transcript.turns[0].tool_calls.at(0).output.find(replacement), std::string::npos);
    EXPECT_EQ(transcript.meta.flow_id, "impl" + replacement);
    EXPECT_EQ(transcript.meta.status, RunStatus::Failed);

    auto meta = fresh.load_metadata("run-1");
    ASSERT_FALSE(is_error(meta));
    EXPECT_EQ(get_value(meta).error, "exit " + replacement);
}

TEST(TranscriptStoreTest, LargeTranscriptIsCompressed) {
    TempWorkspace workspace("transcripts");
    TranscriptStore store(workspace.root(), 1024);
    ASSERT_FALSE(is_error(store.start_run("run-1", start_info("impl"))));
    const std::string content(4000, 'w');
    ASSERT_FALSE(is_error(store.record_turn("run-1", make_turn(TurnRole::Assistant, content, 0, 10))));
    ASSERT_FALSE(is_error(store.end_run("run-1", RunStatus::Completed)));

    const auto dir = workspace.root() / "runs" / "run-1";
    EXPECT_TRUE(std::filesystem::exists(dir / "transcript.json.gz"));
    EXPECT_FALSE(std::filesystem::exists(dir / "transcript.json"));

    TranscriptStore reader(workspace.root());
    auto loaded = reader.load("run-1");
    ASSERT_FALSE(is_error(loaded));
    ASSERT_EQ(get_value(loaded).turns.size(), 1u);
    EXPECT_EQ(get_value(loaded).turns[0].content, content);
}

TEST(TranscriptStoreTest, LoadFromFreshStoreAndMissingRuns) {
    TempWorkspace workspace("transcripts");
    {
        TranscriptStore writer(workspace.root());
        ASSERT_FALSE(is_error(writer.start_run("run-1", start_info("impl"))));
        ASSERT_FALSE(is_error(writer.record_turn("run-1", make_turn(TurnRole::User, "hello", 3, 0))));
        ASSERT_FALSE(is_error(writer.end_run("run-1", RunStatus::Completed)));
    }

    TranscriptStore reader(workspace.root());
    auto loaded = reader.load("run-1");
    ASSERT_FALSE(is_error(loaded));
    EXPECT_EQ(get_value(loaded).turns[0].content, "hello");

    auto missing = reader.load("run-404");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).category, ErrorCategory::NotFound);
    EXPECT_EQ(get_error(missing).code, "run_not_found");

    auto missing_meta = reader.load_metadata("run-404");
    ASSERT_TRUE(is_error(missing_meta));
    EXPECT_EQ(get_error(missing_meta).code, "run_not_found");
}

TEST(TranscriptStoreTest, ListFiltersAndSortsNewestFirst) {
    TempWorkspace workspace("transcripts");
    TranscriptStore store(workspace.root());
    ASSERT_FALSE(is_error(store.start_run("run-a", start_info("impl"))));
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    ASSERT_FALSE(is_error(store.start_run("run-b", start_info("review"))));
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    ASSERT_FALSE(is_error(store.start_run("run-c", start_info("impl"))));
    ASSERT_FALSE(is_error(store.end_run("run-a", RunStatus::Completed)));
    ASSERT_FALSE(is_error(store.end_run("run-b", RunStatus::Failed)));
    std::filesystem::create_directories(workspace.root() / "runs" / ".run-d.restore-1234");

    auto all = store.list(ListFilter{});
    ASSERT_FALSE(is_error(all));
    ASSERT_EQ(get_value(all).size(), 3u);
    EXPECT_EQ(get_value(all)[0].run_id, "run-c");
    EXPECT_EQ(get_value(all)[1].run_id, "run-b");
    EXPECT_EQ(get_value(all)[2].run_id, "run-a");

    ListFilter by_flow;
    by_flow.flow_id = "impl";
    auto impl = store.list(by_flow);
    ASSERT_FALSE(is_error(impl));
    ASSERT_EQ(get_value(impl).size(), 2u);
    EXPECT_EQ(get_value(impl)[0].run_id, "run-c");

    ListFilter by_status;
    by_status.status = RunStatus::Failed;
    auto failed = store.list(by_status);
    ASSERT_FALSE(is_error(failed));
    ASSERT_EQ(get_value(failed).size(), 1u);
    EXPECT_EQ(get_value(failed)[0].run_id, "run-b");

    ListFilter limited;
    limited.limit = 1;
    auto one = store.list(limited);
    ASSERT_FALSE(is_error(one));
    ASSERT_EQ(get_value(one).size(), 1u);
    EXPECT_EQ(get_value(one)[0].run_id, "run-c");

    TranscriptStore empty(workspace.root() / "nothing-here");
    auto none = empty.list(ListFilter{});
    ASSERT_FALSE(is_error(none));
    EXPECT_TRUE(get_value(none).empty());
}

TEST(TranscriptStoreTest, DeleteRunRemovesActiveAndFinishedRuns) {
    TempWorkspace workspace("transcripts");
    TranscriptStore store(workspace.root());
    ASSERT_FALSE(is_error(store.start_run("run-active", start_info("impl"))));
    ASSERT_FALSE(is_error(store.start_run("run-done", start_info("impl"))));
    ASSERT_FALSE(is_error(store.end_run("run-done", RunStatus::Completed)));

    auto active = store.delete_run("run-active");
    ASSERT_FALSE(is_error(active));
    EXPECT_EQ(get_value(active), "run-active");
    EXPECT_TRUE(store.list_active().empty());
    EXPECT_FALSE(std::filesystem::exists(workspace.root() / "runs" / "run-active"));

    auto late = store.record_turn("run-active", make_turn(TurnRole::User, "late", 1, 0));
    ASSERT_TRUE(is_error(late));
    EXPECT_EQ(get_error(late).code, "run_not_started");

    ASSERT_FALSE(is_error(store.delete_run("run-done")));
    EXPECT_FALSE(std::filesystem::exists(workspace.root() / "runs" / "run-done"));

    auto missing = store.delete_run("run-done");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "run_not_found");
}

// A full agent run: transcript, artifacts and listing through the same root.
TEST(TranscriptStoreTest, EndToEndRunWithArtifacts) {
    TempWorkspace workspace("transcripts");
    TranscriptStore store(workspace.root());
    runvault::session::ArtifactManager artifacts(workspace.root());
    const std::string run_id = runvault::core::config::generate_run_id("impl");

    ASSERT_FALSE(is_error(store.start_run(run_id, start_info("impl"))));
    ASSERT_FALSE(is_error(store.record_turn(run_id, make_turn(TurnRole::User, "Build a parser", 100, 0))));
    ASSERT_FALSE(is_error(store.record_turn(run_id, make_turn(TurnRole::Assistant, "Plan ready", 0, 130))));
    ASSERT_FALSE(is_error(artifacts.save_spec(run_id, "# Parser spec\n")));
    ASSERT_FALSE(is_error(artifacts.save_diff(run_id, "+int parse();\n")));
    ASSERT_FALSE(is_error(store.add_cost(run_id, 0.02)));
    ASSERT_FALSE(is_error(store.end_run(run_id, RunStatus::Completed)));

    auto listed = store.list(ListFilter{});
    ASSERT_FALSE(is_error(listed));
    ASSERT_EQ(get_value(listed).size(), 1u);
    EXPECT_EQ(get_value(listed)[0].run_id, run_id);
    EXPECT_EQ(get_value(listed)[0].total_tokens_in, 100);
    EXPECT_EQ(get_value(listed)[0].total_tokens_out, 130);

    auto names = artifacts.list_artifacts(run_id);
    ASSERT_FALSE(is_error(names));
    ASSERT_EQ(get_value(names).size(), 2u);
    EXPECT_EQ(get_value(names)[0].name, "implementation.diff");
    EXPECT_EQ(get_value(names)[1].name, "spec.md");

    auto spec = artifacts.load_spec(run_id);
    ASSERT_FALSE(is_error(spec));
    EXPECT_EQ(get_value(spec), "# Parser spec\n");
}

}  // namespace

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/time/timestamp.hpp"

namespace runvault::protocol {

enum class RunStatus {
    Running,
    Completed,
    Failed,
    Canceled
};

enum class TurnRole {
    System,
    User,
    Assistant,
    ToolResult
};

struct ToolCall {
    std::string id;
    std::string name;
    nlohmann::json input = nlohmann::json::object();
    std::string output;
    std::string error;
};

struct Turn {
    int id = 0;  // assigned by the store, 1-based
    TurnRole role = TurnRole::User;
    std::string content;
    std::int64_t tokens_in = 0;
    std::int64_t tokens_out = 0;
    core::time::TimePoint timestamp{};  // stamped on append when unset
    std::vector<ToolCall> tool_calls;
    std::optional<std::int64_t> duration_ms;
};

// Persisted as metadata.json and embedded in the transcript document.
struct RunMeta {
    std::string run_id;
    std::string flow_id;
    std::string node_id;
    nlohmann::json input = nlohmann::json::object();
    RunStatus status = RunStatus::Running;
    core::time::TimePoint started_at{};
    core::time::TimePoint ended_at{};  // TimePoint{} while running
    std::int64_t total_tokens_in = 0;
    std::int64_t total_tokens_out = 0;
    double total_cost = 0.0;
    int turn_count = 0;
    std::string error;

    bool has_ended() const { return ended_at != core::time::TimePoint{}; }
};

struct Transcript {
    std::string run_id;
    RunMeta meta;
    std::vector<Turn> turns;
};

struct RunStartInfo {
    std::string flow_id;
    std::string node_id;
    nlohmann::json input = nlohmann::json::object();
};

inline std::string to_string(const RunStatus status) {
    switch (status) {
        case RunStatus::Running:
            return "running";
        case RunStatus::Completed:
            return "completed";
        case RunStatus::Failed:
            return "failed";
        case RunStatus::Canceled:
            return "canceled";
        default:
            return "unknown";
    }
}

inline std::optional<RunStatus> parse_run_status(const std::string& text) {
    if (text == "running") return RunStatus::Running;
    if (text == "completed") return RunStatus::Completed;
    if (text == "failed") return RunStatus::Failed;
    if (text == "canceled" || text == "cancelled") return RunStatus::Canceled;
    return std::nullopt;
}

inline std::string to_string(const TurnRole role) {
    switch (role) {
        case TurnRole::System:
            return "system";
        case TurnRole::User:
            return "user";
        case TurnRole::Assistant:
            return "assistant";
        case TurnRole::ToolResult:
            return "tool_result";
        default:
            return "unknown";
    }
}

inline std::optional<TurnRole> parse_turn_role(const std::string& text) {
    if (text == "system") return TurnRole::System;
    if (text == "user") return TurnRole::User;
    if (text == "assistant") return TurnRole::Assistant;
    if (text == "tool_result") return TurnRole::ToolResult;
    return std::nullopt;
}

}  // namespace runvault::protocol

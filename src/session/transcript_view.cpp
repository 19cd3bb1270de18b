#include "session/transcript_view.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <sstream>
#include "session/metadata_codec.hpp"

namespace runvault::session {

namespace {

constexpr std::size_t kPreviewLength = 100;
constexpr std::size_t kToolOutputPreview = 200;

std::string money(const double value) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "$%.2f", value);
    return buffer;
}

std::string preview(std::string text, const std::size_t limit) {
    if (text.size() > limit) {
        text = text.substr(0, limit) + "...";
    }
    std::replace(text.begin(), text.end(), '\n', ' ');
    return text;
}

std::string truncate(const std::string& text, const std::size_t limit) {
    if (text.size() <= limit) {
        return text;
    }
    if (limit <= 3) {
        return text.substr(0, limit);
    }
    return text.substr(0, limit - 3) + "...";
}

std::string upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

std::string title(std::string text) {
    if (!text.empty()) {
        text[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(text[0])));
    }
    return text;
}

std::string pad_right(const std::string& text, const std::size_t width) {
    return text.size() >= width ? text : text + std::string(width - text.size(), ' ');
}

std::string pad_left(const std::string& text, const std::size_t width) {
    return text.size() >= width ? text : std::string(width - text.size(), ' ') + text;
}

void write_header(std::ostream& out, const protocol::Transcript& t) {
    const std::string sep(60, '=');
    out << sep << "\n";
    out << "Run: " << t.run_id << "\n";
    out << "Flow: " << t.meta.flow_id << " | Status: " << protocol::to_string(t.meta.status)
        << "\n";
    out << "Started: " << core::time::format_utc(t.meta.started_at, "%Y-%m-%d %H:%M:%S")
        << " | Duration: " << format_run_duration(t.meta) << "\n";
    out << "Tokens: " << t.meta.total_tokens_in << " in / " << t.meta.total_tokens_out
        << " out | Cost: " << money(t.meta.total_cost) << "\n";
    if (!t.meta.error.empty()) {
        out << "Error: " << t.meta.error << "\n";
    }
    out << sep << "\n";
}

void write_turn(std::ostream& out, const protocol::Turn& turn) {
    out << "\n[" << turn.id << "] " << upper(protocol::to_string(turn.role)) << " ("
        << core::time::format_utc(turn.timestamp, "%H:%M:%S") << ")";
    if (turn.tokens_in > 0) {
        out << " [" << turn.tokens_in << " tokens in]";
    }
    if (turn.tokens_out > 0) {
        out << " [" << turn.tokens_out << " tokens out]";
    }
    if (turn.duration_ms.has_value() && turn.duration_ms.value() > 0) {
        out << " [" << turn.duration_ms.value() << "ms]";
    }
    out << "\n" << std::string(60, '-') << "\n";
    out << turn.content << "\n";

    for (const auto& call : turn.tool_calls) {
        out << "\n  Tool: " << call.name << "\n";
        if (!call.input.is_null() && !call.input.empty()) {
            out << "     Input: " << dump_json(call.input, -1) << "\n";
        }
        if (!call.output.empty()) {
            const std::string shown = call.output.size() > kToolOutputPreview
                                          ? call.output.substr(0, kToolOutputPreview) + "..."
                                          : call.output;
            out << "     Output: " << shown << "\n";
        }
        if (!call.error.empty()) {
            out << "     Error: " << call.error << "\n";
        }
    }
}

}  // namespace

std::string format_run_duration(const protocol::RunMeta& meta) {
    const auto end = meta.has_ended() ? meta.ended_at : core::time::Clock::now();
    auto seconds = std::chrono::duration_cast<std::chrono::milliseconds>(end - meta.started_at)
                       .count();
    seconds = seconds < 0 ? 0 : (seconds + 500) / 1000;

    const long long hours = seconds / 3600;
    const long long minutes = (seconds % 3600) / 60;
    const long long secs = seconds % 60;
    std::ostringstream out;
    if (hours > 0) {
        out << hours << "h" << minutes << "m";
    } else if (minutes > 0) {
        out << minutes << "m";
    }
    out << secs << "s";
    return out.str();
}

std::string render_summary(const protocol::Transcript& transcript) {
    std::ostringstream out;
    write_header(out, transcript);
    out << "\nTurn Summary:\n";
    for (const auto& turn : transcript.turns) {
        out << "  [" << turn.id << "] " << protocol::to_string(turn.role) << ": "
            << preview(turn.content, kPreviewLength) << "\n";
    }
    return out.str();
}

std::string render_full(const protocol::Transcript& transcript) {
    std::ostringstream out;
    write_header(out, transcript);
    for (const auto& turn : transcript.turns) {
        write_turn(out, turn);
    }
    return out.str();
}

std::string export_markdown(const protocol::Transcript& transcript) {
    const auto& meta = transcript.meta;
    std::ostringstream out;
    out << "# Transcript: " << transcript.run_id << "\n\n";

    out << "## Metadata\n\n";
    out << "| Field | Value |\n";
    out << "|-------|-------|\n";
    out << "| Flow | " << meta.flow_id << " |\n";
    out << "| Status | " << protocol::to_string(meta.status) << " |\n";
    out << "| Started | " << core::time::format_rfc3339(meta.started_at) << " |\n";
    if (meta.has_ended()) {
        out << "| Ended | " << core::time::format_rfc3339(meta.ended_at) << " |\n";
    }
    out << "| Duration | " << format_run_duration(meta) << " |\n";
    out << "| Tokens In | " << meta.total_tokens_in << " |\n";
    out << "| Tokens Out | " << meta.total_tokens_out << " |\n";
    out << "| Cost | " << money(meta.total_cost) << " |\n";
    if (!meta.error.empty()) {
        out << "| Error | " << meta.error << " |\n";
    }
    out << "\n## Conversation\n\n";

    for (const auto& turn : transcript.turns) {
        out << "### " << title(protocol::to_string(turn.role)) << " (Turn " << turn.id
            << ")\n\n";
        if (turn.tokens_in > 0) {
            out << "*" << turn.tokens_in << " tokens in*\n\n";
        }
        if (turn.tokens_out > 0) {
            out << "*" << turn.tokens_out << " tokens out*\n\n";
        }
        out << turn.content << "\n\n";

        for (const auto& call : turn.tool_calls) {
            out << "#### Tool Call: `" << call.name << "`\n\n";
            if (!call.input.is_null()) {
                out << "**Input:**\n```json\n" << dump_json(call.input) << "\n```\n\n";
            }
            if (!call.output.empty()) {
                out << "**Output:**\n```\n" << call.output << "\n```\n\n";
            }
            if (!call.error.empty()) {
                out << "**Error:** " << call.error << "\n\n";
            }
        }
    }
    return out.str();
}

std::string format_meta_list(const std::vector<protocol::RunMeta>& metas) {
    if (metas.empty()) {
        return "No runs found.\n";
    }

    std::ostringstream out;
    out << pad_right("RUN ID", 40) << " " << pad_right("STATUS", 12) << " "
        << pad_right("STARTED", 20) << " " << pad_left("TOKENS", 8) << " "
        << pad_left("COST", 8) << " " << pad_left("TURNS", 8) << "\n";
    out << std::string(100, '-') << "\n";
    for (const auto& m : metas) {
        const std::string tokens =
            std::to_string(m.total_tokens_in) + "/" + std::to_string(m.total_tokens_out);
        out << pad_right(truncate(m.run_id, 40), 40) << " "
            << pad_right(protocol::to_string(m.status), 12) << " "
            << pad_right(core::time::format_utc(m.started_at, "%Y-%m-%d %H:%M"), 20) << " "
            << pad_left(tokens, 8) << " " << pad_left(money(m.total_cost), 8) << " "
            << pad_left(std::to_string(m.turn_count), 8) << "\n";
    }
    out << "\nTotal: " << metas.size() << " runs\n";
    return out.str();
}

std::string format_stats(const RunStatistics& stats) {
    std::ostringstream out;
    out << "Run Statistics:\n";
    out << std::string(40, '-') << "\n";
    out << "Total Runs:      " << stats.total_runs << "\n";
    out << "  Completed:     " << stats.completed_runs << "\n";
    out << "  Failed:        " << stats.failed_runs << "\n";
    out << "  Canceled:      " << stats.canceled_runs << "\n";
    out << "  Active:        " << stats.active_runs << "\n\n";
    out << "Total Tokens:    " << stats.total_tokens_in << " in / " << stats.total_tokens_out
        << " out\n";
    out << "Avg Tokens/Run:  " << stats.avg_tokens_in << " in / " << stats.avg_tokens_out
        << " out\n\n";
    out << "Total Cost:      " << money(stats.total_cost) << "\n";
    out << "Avg Cost/Run:    " << money(stats.avg_cost) << "\n";
    return out.str();
}

}  // namespace runvault::session

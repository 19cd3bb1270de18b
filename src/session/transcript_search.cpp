#include "session/transcript_search.hpp"

#include <algorithm>
#include <sstream>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "session/metadata_codec.hpp"
#include "tools/process_runner.hpp"

namespace runvault::session {

using core::errors::ErrorCategory;
using core::errors::StoreError;
using nlohmann::json;
using protocol::RunMeta;

namespace {

constexpr std::uint32_t kSearchTimeoutMs = 60000;

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

bool runs_dir_exists(const std::filesystem::path& runs_dir) {
    std::error_code ec;
    return std::filesystem::is_directory(runs_dir, ec) && !ec;
}

// Exit status 1 is "no matches" for both rg and grep.
core::errors::Result<std::string> run_search_tool(const std::string& tool,
                                                  std::vector<std::string> argv) {
    tools::ProcessRequest request;
    request.argv = std::move(argv);
    request.timeout_ms = kSearchTimeoutMs;

    auto capture = tools::run_process(request);
    if (core::errors::is_error(capture)) {
        return core::errors::get_error(capture);
    }
    const auto& result = core::errors::get_value(capture);
    if (result.timed_out) {
        return StoreError{ErrorCategory::Internal, tool + " timed out", "search_failed"};
    }
    if (result.exit_code == 1) {
        return std::string();
    }
    if (result.exit_code != 0) {
        return StoreError{ErrorCategory::Internal,
                          tool + " exited with status " + std::to_string(result.exit_code) +
                              ": " + trim(result.stderr_text),
                          "search_failed"};
    }
    return result.stdout_text;
}

void sort_newest_first(std::vector<RunMeta>& metas) {
    std::sort(metas.begin(), metas.end(), [](const RunMeta& a, const RunMeta& b) {
        if (a.started_at != b.started_at) {
            return a.started_at > b.started_at;
        }
        return a.run_id < b.run_id;
    });
}

}  // namespace

std::string extract_run_id(const std::string& match_path, const std::filesystem::path& runs_dir) {
    const std::filesystem::path path(match_path);
    const auto relative = path.lexically_normal().lexically_relative(runs_dir.lexically_normal());
    if (!relative.empty()) {
        const std::string first = relative.begin()->string();
        if (first != ".." && first != "." && !first.empty()) {
            return first;
        }
    }

    bool next_is_run = false;
    for (const auto& part : path) {
        if (next_is_run) {
            return part.string();
        }
        next_is_run = part == "runs";
    }
    return "";
}

RipgrepBackend::RipgrepBackend(std::filesystem::path executable)
    : executable_(std::move(executable)) {}

std::vector<SearchResult> RipgrepBackend::parse_output(const std::string& output,
                                                       const std::filesystem::path& runs_dir,
                                                       const std::size_t max_results) {
    std::vector<SearchResult> results;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) {
            continue;
        }
        json message;
        try {
            message = json::parse(line);
        } catch (const json::parse_error& e) {
            LOG_DEBUG(std::string("Ignoring malformed ripgrep line: ") + e.what());
            continue;
        }
        if (!message.is_object() || message.value("type", "") != "match") {
            continue;
        }
        const json data = message.value("data", json::object());
        // Non UTF-8 paths and lines arrive as {"bytes": ...}; they are skipped.
        const json path = data.value("path", json::object());
        const json lines = data.value("lines", json::object());
        if (!path.contains("text") || !path.at("text").is_string()) {
            continue;
        }

        SearchResult result;
        result.run_id = extract_run_id(path.at("text").get<std::string>(), runs_dir);
        if (result.run_id.empty()) {
            continue;
        }
        if (lines.contains("text") && lines.at("text").is_string()) {
            result.text = trim(lines.at("text").get<std::string>());
        }
        if (data.contains("line_number") && data.at("line_number").is_number_integer()) {
            result.line_number = data.at("line_number").get<int>();
        }
        results.push_back(std::move(result));
        if (max_results > 0 && results.size() >= max_results) {
            break;
        }
    }
    return results;
}

core::errors::Result<std::vector<SearchResult>> RipgrepBackend::search(
    const std::filesystem::path& runs_dir, const std::string& query,
    const SearchOptions& options) const {
    if (!runs_dir_exists(runs_dir)) {
        return std::vector<SearchResult>{};
    }

    std::vector<std::string> argv = {executable_.string(), "--json", "-z",
                                     "-g", "transcript.json", "-g", "transcript.json.gz"};
    if (!options.case_sensitive) {
        argv.push_back("-i");
    }
    if (options.max_results > 0) {
        argv.push_back("-m");
        argv.push_back(std::to_string(options.max_results));
    }
    argv.push_back("-e");
    argv.push_back(query);
    argv.push_back(runs_dir.string());

    auto output = run_search_tool("rg", std::move(argv));
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return parse_output(core::errors::get_value(output), runs_dir, options.max_results);
}

GrepBackend::GrepBackend(std::filesystem::path executable)
    : executable_(std::move(executable)) {}

std::vector<SearchResult> GrepBackend::parse_output(const std::string& output,
                                                    const std::filesystem::path& runs_dir,
                                                    const std::size_t max_results) {
    std::vector<SearchResult> results;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        // -Z output: "<path>\0<line>:<text>"
        const auto nul = line.find('\0');
        if (nul == std::string::npos) {
            continue;
        }
        SearchResult result;
        result.run_id = extract_run_id(line.substr(0, nul), runs_dir);
        if (result.run_id.empty()) {
            continue;
        }

        const std::string rest = line.substr(nul + 1);
        const auto colon = rest.find(':');
        if (colon != std::string::npos && colon > 0 &&
            std::all_of(rest.begin(), rest.begin() + static_cast<std::ptrdiff_t>(colon),
                        [](const unsigned char c) { return c >= '0' && c <= '9'; })) {
            result.line_number = std::stoi(rest.substr(0, colon));
            result.text = trim(rest.substr(colon + 1));
        } else {
            result.text = trim(rest);
        }
        results.push_back(std::move(result));
        if (max_results > 0 && results.size() >= max_results) {
            break;
        }
    }
    return results;
}

core::errors::Result<std::vector<SearchResult>> GrepBackend::search(
    const std::filesystem::path& runs_dir, const std::string& query,
    const SearchOptions& options) const {
    if (!runs_dir_exists(runs_dir)) {
        return std::vector<SearchResult>{};
    }

    std::vector<std::string> argv = {executable_.string(), "-r", "-n", "-Z",
                                     "--include=transcript.json"};
    if (!options.case_sensitive) {
        argv.push_back("-i");
    }
    argv.push_back("-e");
    argv.push_back(query);
    argv.push_back(runs_dir.string());

    auto output = run_search_tool("grep", std::move(argv));
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return parse_output(core::errors::get_value(output), runs_dir, options.max_results);
}

std::unique_ptr<SearchBackend> detect_search_backend() {
    if (const auto rg = tools::find_in_path("rg")) {
        LOG_DEBUG("Using ripgrep at " + rg->string());
        return std::make_unique<RipgrepBackend>(rg.value());
    }
    if (const auto grep = tools::find_in_path("grep")) {
        LOG_DEBUG("ripgrep not found; falling back to grep at " + grep->string());
        return std::make_unique<GrepBackend>(grep.value());
    }
    return nullptr;
}

TranscriptSearcher::TranscriptSearcher(std::filesystem::path base_dir)
    : TranscriptSearcher(std::move(base_dir), detect_search_backend()) {}

TranscriptSearcher::TranscriptSearcher(std::filesystem::path base_dir,
                                       std::unique_ptr<SearchBackend> backend)
    : base_dir_(std::move(base_dir)), backend_(std::move(backend)) {}

core::errors::Result<std::vector<SearchResult>> TranscriptSearcher::search_content(
    const std::string& query, const SearchOptions& options) const {
    if (query.empty()) {
        return StoreError{ErrorCategory::Input, "Search query cannot be empty.", "empty_query"};
    }
    if (!backend_) {
        return StoreError{ErrorCategory::Internal, "Neither rg nor grep was found on PATH",
                          "search_unavailable", "Install ripgrep or grep."};
    }
    return backend_->search(base_dir_ / "runs", query, options);
}

core::errors::Result<std::vector<RunMeta>> TranscriptSearcher::find_by_metadata(
    const std::function<bool(const RunMeta&)>& predicate) const {
    std::vector<RunMeta> results;
    const auto runs_dir = base_dir_ / "runs";
    std::error_code ec;
    if (!std::filesystem::is_directory(runs_dir, ec) || ec) {
        return results;
    }

    std::filesystem::directory_iterator it(runs_dir, ec);
    for (; !ec && it != std::filesystem::end(it); it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_directory(entry_ec) || entry_ec) {
            continue;
        }
        auto meta = read_metadata(it->path());
        if (core::errors::is_error(meta)) {
            LOG_DEBUG("Skipping " + it->path().string() + ": " +
                      core::errors::get_error(meta).message);
            continue;
        }
        if (predicate(core::errors::get_value(meta))) {
            results.push_back(core::errors::take_value(std::move(meta)));
        }
    }
    if (ec) {
        return StoreError{ErrorCategory::Io,
                          "Unable to scan runs directory: " + runs_dir.string() + ": " +
                              ec.message(),
                          "run_scan_failed"};
    }
    sort_newest_first(results);
    return results;
}

core::errors::Result<std::vector<RunMeta>> TranscriptSearcher::find_by_flow(
    const std::string& flow_id) const {
    return find_by_metadata([&flow_id](const RunMeta& m) { return m.flow_id == flow_id; });
}

core::errors::Result<std::vector<RunMeta>> TranscriptSearcher::find_by_status(
    const protocol::RunStatus status) const {
    return find_by_metadata([status](const RunMeta& m) { return m.status == status; });
}

core::errors::Result<std::vector<RunMeta>> TranscriptSearcher::find_by_date_range(
    const core::time::TimePoint start, const core::time::TimePoint end) const {
    return find_by_metadata([start, end](const RunMeta& m) {
        return m.started_at > start && m.started_at < end;
    });
}

core::errors::Result<std::vector<RunMeta>> TranscriptSearcher::find_by_token_range(
    const std::int64_t min_in, const std::int64_t max_in, const std::int64_t min_out,
    const std::int64_t max_out) const {
    return find_by_metadata([=](const RunMeta& m) {
        if (min_in > 0 && m.total_tokens_in < min_in) {
            return false;
        }
        if (max_in > 0 && m.total_tokens_in > max_in) {
            return false;
        }
        if (min_out > 0 && m.total_tokens_out < min_out) {
            return false;
        }
        if (max_out > 0 && m.total_tokens_out > max_out) {
            return false;
        }
        return true;
    });
}

core::errors::Result<RunStatistics> TranscriptSearcher::run_stats(const ListFilter& filter) const {
    TranscriptStore store(base_dir_);
    auto runs = store.list(filter);
    if (core::errors::is_error(runs)) {
        return core::errors::get_error(runs);
    }

    RunStatistics stats;
    for (const auto& run : core::errors::get_value(runs)) {
        ++stats.total_runs;
        stats.total_tokens_in += run.total_tokens_in;
        stats.total_tokens_out += run.total_tokens_out;
        stats.total_cost += run.total_cost;
        switch (run.status) {
            case protocol::RunStatus::Completed:
                ++stats.completed_runs;
                break;
            case protocol::RunStatus::Failed:
                ++stats.failed_runs;
                break;
            case protocol::RunStatus::Canceled:
                ++stats.canceled_runs;
                break;
            case protocol::RunStatus::Running:
                ++stats.active_runs;
                break;
        }
    }
    if (stats.total_runs > 0) {
        const auto count = static_cast<std::int64_t>(stats.total_runs);
        stats.avg_tokens_in = stats.total_tokens_in / count;
        stats.avg_tokens_out = stats.total_tokens_out / count;
        stats.avg_cost = stats.total_cost / static_cast<double>(stats.total_runs);
    }
    return stats;
}

}  // namespace runvault::session

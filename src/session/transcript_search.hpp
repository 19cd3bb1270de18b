#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/store_errors.hpp"
#include "protocol/transcript_contract.hpp"
#include "session/transcript_store.hpp"

namespace runvault::session {

struct SearchOptions {
    bool case_sensitive = false;
    std::size_t max_results = 0;  // 0 means unlimited
};

struct SearchResult {
    std::string run_id;
    std::optional<int> line_number;
    std::string text;
};

// A content search tool run as a subprocess over <base>/runs.
class SearchBackend {
public:
    virtual ~SearchBackend() = default;

    virtual std::string name() const = 0;
    virtual core::errors::Result<std::vector<SearchResult>> search(
        const std::filesystem::path& runs_dir, const std::string& query,
        const SearchOptions& options) const = 0;
};

// ripgrep in --json mode; also searches gzip-compressed transcripts.
class RipgrepBackend : public SearchBackend {
public:
    explicit RipgrepBackend(std::filesystem::path executable = "rg");

    std::string name() const override { return "ripgrep"; }
    core::errors::Result<std::vector<SearchResult>> search(
        const std::filesystem::path& runs_dir, const std::string& query,
        const SearchOptions& options) const override;

    static std::vector<SearchResult> parse_output(const std::string& output,
                                                  const std::filesystem::path& runs_dir,
                                                  std::size_t max_results);

private:
    std::filesystem::path executable_;
};

// POSIX grep fallback. Plain transcript.json files only.
class GrepBackend : public SearchBackend {
public:
    explicit GrepBackend(std::filesystem::path executable = "grep");

    std::string name() const override { return "grep"; }
    core::errors::Result<std::vector<SearchResult>> search(
        const std::filesystem::path& runs_dir, const std::string& query,
        const SearchOptions& options) const override;

    static std::vector<SearchResult> parse_output(const std::string& output,
                                                  const std::filesystem::path& runs_dir,
                                                  std::size_t max_results);

private:
    std::filesystem::path executable_;
};

// Probes PATH for rg, then grep. Returns nullptr when neither exists.
std::unique_ptr<SearchBackend> detect_search_backend();

// Run id of a match path: the first component below `runs_dir`, or the
// component following a "runs" directory. Empty when neither applies.
std::string extract_run_id(const std::string& match_path, const std::filesystem::path& runs_dir);

struct RunStatistics {
    std::size_t total_runs = 0;
    std::size_t completed_runs = 0;
    std::size_t failed_runs = 0;
    std::size_t canceled_runs = 0;
    std::size_t active_runs = 0;
    std::int64_t total_tokens_in = 0;
    std::int64_t total_tokens_out = 0;
    std::int64_t avg_tokens_in = 0;
    std::int64_t avg_tokens_out = 0;
    double total_cost = 0.0;
    double avg_cost = 0.0;
};

class TranscriptSearcher {
public:
    // Picks the search backend once, at construction.
    explicit TranscriptSearcher(std::filesystem::path base_dir);
    TranscriptSearcher(std::filesystem::path base_dir, std::unique_ptr<SearchBackend> backend);

    const SearchBackend* backend() const { return backend_.get(); }

    core::errors::Result<std::vector<SearchResult>> search_content(
        const std::string& query, const SearchOptions& options = {}) const;

    core::errors::Result<std::vector<protocol::RunMeta>> find_by_flow(
        const std::string& flow_id) const;
    core::errors::Result<std::vector<protocol::RunMeta>> find_by_status(
        protocol::RunStatus status) const;
    // Runs started strictly between `start` and `end`.
    core::errors::Result<std::vector<protocol::RunMeta>> find_by_date_range(
        core::time::TimePoint start, core::time::TimePoint end) const;
    // Bounds of 0 are ignored.
    core::errors::Result<std::vector<protocol::RunMeta>> find_by_token_range(
        std::int64_t min_in, std::int64_t max_in, std::int64_t min_out,
        std::int64_t max_out) const;

    core::errors::Result<RunStatistics> run_stats(const ListFilter& filter = {}) const;

private:
    core::errors::Result<std::vector<protocol::RunMeta>> find_by_metadata(
        const std::function<bool(const protocol::RunMeta&)>& predicate) const;

    std::filesystem::path base_dir_;
    std::unique_ptr<SearchBackend> backend_;
};

}  // namespace runvault::session

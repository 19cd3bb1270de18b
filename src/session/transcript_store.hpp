#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "core/config/store_config.hpp"
#include "core/errors/store_errors.hpp"
#include "protocol/transcript_contract.hpp"

namespace runvault::session {

struct ListFilter {
    std::string flow_id;                       // empty matches every flow
    std::optional<protocol::RunStatus> status;
    core::time::TimePoint started_after{};     // TimePoint{} disables the bound
    core::time::TimePoint started_before{};
    std::size_t limit = 0;                     // 0 means unlimited
};

// Records conversation turns for in-flight runs and persists the sealed
// transcript when the run ends.
//
// Thread safety: every method may be called concurrently. The active-run
// table has its own mutex and each active run is guarded by a per-run mutex,
// so turns for different runs never contend. A turn racing end_run() for the
// same run either lands before the transcript is persisted or fails with
// "run_not_started".
class TranscriptStore {
public:
    explicit TranscriptStore(std::filesystem::path base_dir,
                             std::size_t compress_above = core::config::kTranscriptCompressAbove);

    TranscriptStore(const TranscriptStore&) = delete;
    TranscriptStore& operator=(const TranscriptStore&) = delete;

    const std::filesystem::path& base_dir() const { return base_dir_; }
    std::filesystem::path run_dir(const std::string& run_id) const;

    core::errors::Result<protocol::RunMeta> start_run(const std::string& run_id,
                                                      const protocol::RunStartInfo& info);

    // Returns the id assigned to the turn.
    core::errors::Result<int> record_turn(const std::string& run_id, protocol::Turn turn);

    // Appends to the most recent turn, which must be an assistant turn.
    // Returns the number of tool calls now on that turn.
    core::errors::Result<std::size_t> record_tool_call(const std::string& run_id,
                                                       protocol::ToolCall call);

    // Returns the new running total.
    core::errors::Result<double> add_cost(const std::string& run_id, double cost);

    core::errors::Result<protocol::RunMeta> end_run(const std::string& run_id,
                                                    protocol::RunStatus status);
    core::errors::Result<protocol::RunMeta> end_run_with_error(const std::string& run_id,
                                                               const std::string& message);

    core::errors::Result<protocol::Transcript> load(const std::string& run_id) const;
    core::errors::Result<protocol::RunMeta> load_metadata(const std::string& run_id) const;
    core::errors::Result<std::vector<protocol::RunMeta>> list(const ListFilter& filter) const;
    core::errors::Result<std::string> delete_run(const std::string& run_id);
    std::vector<std::string> list_active() const;

private:
    struct ActiveRun {
        std::mutex mutex;
        protocol::Transcript transcript;
        bool ended = false;
    };

    // Creates the run directory and initial metadata. Runs without table_mutex_.
    core::errors::Result<std::shared_ptr<ActiveRun>> create_run(
        const std::string& run_id, const protocol::RunStartInfo& info) const;
    std::shared_ptr<ActiveRun> find_active(const std::string& run_id) const;
    void forget_active(const std::string& run_id, const std::shared_ptr<ActiveRun>& run);
    core::errors::Result<protocol::RunMeta> finish_run(const std::string& run_id,
                                                       protocol::RunStatus status,
                                                       const std::string& error_message);
    core::errors::Result<std::filesystem::path> persist_transcript(
        const protocol::Transcript& transcript) const;

    std::filesystem::path base_dir_;
    std::size_t compress_above_;
    mutable std::mutex table_mutex_;
    std::unordered_map<std::string, std::shared_ptr<ActiveRun>> active_;
    // Ids whose directory and metadata are being created by start_run().
    std::unordered_set<std::string> starting_;
};

}  // namespace runvault::session

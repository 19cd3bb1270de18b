#include "session/transcript_store.hpp"

#include <algorithm>
#include <system_error>
#include <utility>
#include "codec/gzip.hpp"
#include "core/fs/file_io.hpp"
#include "core/logging/logger.hpp"
#include "policy/path_guard.hpp"
#include "session/metadata_codec.hpp"

namespace runvault::session {

using core::errors::ErrorCategory;
using core::errors::StoreError;
using protocol::RunMeta;
using protocol::RunStatus;
using protocol::Transcript;
using protocol::TurnRole;

namespace {

StoreError run_not_started(const std::string& run_id) {
    return StoreError{ErrorCategory::InvalidState, "Run is not active: " + run_id,
                      "run_not_started", "Call start_run before recording turns."};
}

StoreError run_already_exists(const std::string& run_id) {
    return StoreError{ErrorCategory::AlreadyExists, "Run already exists: " + run_id,
                      "run_already_exists"};
}

StoreError run_not_found(const std::string& run_id) {
    return StoreError{ErrorCategory::NotFound, "Run not found: " + run_id, "run_not_found"};
}

bool is_regular(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && !ec;
}

}  // namespace

TranscriptStore::TranscriptStore(std::filesystem::path base_dir, const std::size_t compress_above)
    : base_dir_(std::move(base_dir)), compress_above_(compress_above) {}

std::filesystem::path TranscriptStore::run_dir(const std::string& run_id) const {
    return base_dir_ / "runs" / run_id;
}

std::shared_ptr<TranscriptStore::ActiveRun> TranscriptStore::find_active(
    const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(table_mutex_);
    const auto it = active_.find(run_id);
    return it == active_.end() ? nullptr : it->second;
}

void TranscriptStore::forget_active(const std::string& run_id,
                                    const std::shared_ptr<ActiveRun>& run) {
    std::lock_guard<std::mutex> lock(table_mutex_);
    const auto it = active_.find(run_id);
    if (it != active_.end() && it->second == run) {
        active_.erase(it);
    }
}

core::errors::Result<RunMeta> TranscriptStore::start_run(const std::string& run_id,
                                                         const protocol::RunStartInfo& info) {
    auto valid = policy::PathGuard::validate_name(run_id);
    if (core::errors::is_error(valid)) {
        return StoreError{ErrorCategory::Input, "Invalid run id: '" + run_id + "'",
                          "invalid_run_id"};
    }

    {
        std::lock_guard<std::mutex> lock(table_mutex_);
        if (active_.count(run_id) != 0 || !starting_.insert(run_id).second) {
            return run_already_exists(run_id);
        }
    }

    auto created = create_run(run_id, info);
    {
        std::lock_guard<std::mutex> lock(table_mutex_);
        starting_.erase(run_id);
        if (!core::errors::is_error(created)) {
            active_.emplace(run_id, core::errors::get_value(created));
        }
    }
    if (core::errors::is_error(created)) {
        return core::errors::get_error(created);
    }
    const auto& run = core::errors::get_value(created);
    LOG_INFO("Started run " + run_id + " (flow " + run->transcript.meta.flow_id + ")");
    return run->transcript.meta;
}

core::errors::Result<std::shared_ptr<TranscriptStore::ActiveRun>> TranscriptStore::create_run(
    const std::string& run_id, const protocol::RunStartInfo& info) const {
    const auto dir = run_dir(run_id);
    std::error_code ec;
    if (std::filesystem::exists(dir, ec)) {
        return run_already_exists(run_id);
    }

    auto created = core::fs::ensure_dir(dir);
    if (core::errors::is_error(created)) {
        return core::errors::get_error(created);
    }

    auto run = std::make_shared<ActiveRun>();
    run->transcript.run_id = run_id;
    RunMeta& meta = run->transcript.meta;
    meta.run_id = run_id;
    meta.flow_id = info.flow_id;
    meta.node_id = info.node_id;
    meta.input = info.input.is_null() ? nlohmann::json::object() : info.input;
    meta.status = RunStatus::Running;
    meta.started_at = core::time::Clock::now();

    auto written = write_metadata(dir, meta);
    if (core::errors::is_error(written)) {
        std::error_code ignored;
        std::filesystem::remove_all(dir, ignored);
        return core::errors::get_error(written);
    }
    return run;
}

core::errors::Result<int> TranscriptStore::record_turn(const std::string& run_id,
                                                       protocol::Turn turn) {
    const auto run = find_active(run_id);
    if (!run) {
        return run_not_started(run_id);
    }

    std::lock_guard<std::mutex> lock(run->mutex);
    if (run->ended) {
        return run_not_started(run_id);
    }

    Transcript& transcript = run->transcript;
    turn.id = static_cast<int>(transcript.turns.size()) + 1;
    if (turn.timestamp == core::time::TimePoint{}) {
        turn.timestamp = core::time::Clock::now();
    }

    switch (turn.role) {
        case TurnRole::User:
        case TurnRole::System:
            transcript.meta.total_tokens_in += turn.tokens_in;
            break;
        case TurnRole::Assistant:
            transcript.meta.total_tokens_out += turn.tokens_out;
            break;
        case TurnRole::ToolResult:
            break;
    }

    const int id = turn.id;
    transcript.turns.push_back(std::move(turn));
    transcript.meta.turn_count = static_cast<int>(transcript.turns.size());
    return id;
}

core::errors::Result<std::size_t> TranscriptStore::record_tool_call(const std::string& run_id,
                                                                    protocol::ToolCall call) {
    const auto run = find_active(run_id);
    if (!run) {
        return run_not_started(run_id);
    }

    std::lock_guard<std::mutex> lock(run->mutex);
    if (run->ended) {
        return run_not_started(run_id);
    }

    auto& turns = run->transcript.turns;
    if (turns.empty()) {
        return StoreError{ErrorCategory::InvalidState,
                          "Run " + run_id + " has no turns to attach a tool call to",
                          "no_turns"};
    }
    auto& last = turns.back();
    if (last.role != TurnRole::Assistant) {
        return StoreError{ErrorCategory::InvalidState,
                          "Tool calls attach only to assistant turns; last turn of " + run_id +
                              " is " + protocol::to_string(last.role),
                          "invalid_state"};
    }
    last.tool_calls.push_back(std::move(call));
    return last.tool_calls.size();
}

core::errors::Result<double> TranscriptStore::add_cost(const std::string& run_id,
                                                       const double cost) {
    if (!(cost >= 0.0)) {
        return StoreError{ErrorCategory::Input, "Cost must be a non-negative number",
                          "invalid_cost"};
    }

    const auto run = find_active(run_id);
    if (!run) {
        return run_not_started(run_id);
    }

    std::lock_guard<std::mutex> lock(run->mutex);
    if (run->ended) {
        return run_not_started(run_id);
    }
    run->transcript.meta.total_cost += cost;
    return run->transcript.meta.total_cost;
}

core::errors::Result<std::filesystem::path> TranscriptStore::persist_transcript(
    const Transcript& transcript) const {
    const auto dir = run_dir(transcript.run_id);
    const auto plain_path = dir / kTranscriptFile;
    const auto gz_path = dir / (std::string(kTranscriptFile) + kGzipSuffix);

    const std::string encoded = encode_transcript(transcript);
    std::filesystem::path target = plain_path;
    std::filesystem::path stale = gz_path;
    std::string payload = encoded;
    if (encoded.size() > compress_above_) {
        auto packed = codec::gzip_compress(encoded);
        if (core::errors::is_error(packed)) {
            return core::errors::get_error(packed);
        }
        payload = core::errors::take_value(std::move(packed));
        target = gz_path;
        stale = plain_path;
    }

    auto written = core::fs::write_file_atomic(target, payload);
    if (core::errors::is_error(written)) {
        return written;
    }
    auto removed = core::fs::remove_file_if_exists(stale);
    if (core::errors::is_error(removed)) {
        return core::errors::get_error(removed);
    }
    return target;
}

core::errors::Result<RunMeta> TranscriptStore::finish_run(const std::string& run_id,
                                                          const RunStatus status,
                                                          const std::string& error_message) {
    if (status == RunStatus::Running) {
        return StoreError{ErrorCategory::Input, "A run cannot end with status 'running'",
                          "invalid_status"};
    }

    const auto run = find_active(run_id);
    if (!run) {
        return run_not_started(run_id);
    }

    std::lock_guard<std::mutex> lock(run->mutex);
    if (run->ended) {
        return run_not_started(run_id);
    }

    // Work on a copy so a failed write leaves the active run untouched.
    Transcript sealed = run->transcript;
    sealed.meta.status = status;
    sealed.meta.ended_at = core::time::Clock::now();
    if (!error_message.empty()) {
        sealed.meta.error = error_message;
    }

    auto persisted = persist_transcript(sealed);
    if (core::errors::is_error(persisted)) {
        LOG_ERROR("Failed to persist transcript for " + run_id + ": " +
                  core::errors::get_error(persisted).message);
        return core::errors::get_error(persisted);
    }
    auto written = write_metadata(run_dir(run_id), sealed.meta);
    if (core::errors::is_error(written)) {
        LOG_ERROR("Failed to write metadata for " + run_id + ": " +
                  core::errors::get_error(written).message);
        return core::errors::get_error(written);
    }

    run->transcript = std::move(sealed);
    run->ended = true;
    forget_active(run_id, run);

    LOG_INFO("Ended run " + run_id + " with status " + protocol::to_string(status) + " after " +
             std::to_string(run->transcript.meta.turn_count) + " turns");
    return run->transcript.meta;
}

core::errors::Result<RunMeta> TranscriptStore::end_run(const std::string& run_id,
                                                       const RunStatus status) {
    return finish_run(run_id, status, "");
}

core::errors::Result<RunMeta> TranscriptStore::end_run_with_error(const std::string& run_id,
                                                                  const std::string& message) {
    return finish_run(run_id, RunStatus::Failed, message.empty() ? "unknown error" : message);
}

core::errors::Result<Transcript> TranscriptStore::load(const std::string& run_id) const {
    if (const auto run = find_active(run_id)) {
        std::lock_guard<std::mutex> lock(run->mutex);
        if (!run->ended) {
            return run->transcript;
        }
    }

    auto valid = policy::PathGuard::validate_name(run_id);
    if (core::errors::is_error(valid)) {
        return run_not_found(run_id);
    }

    const auto dir = run_dir(run_id);
    const auto gz_path = dir / (std::string(kTranscriptFile) + kGzipSuffix);
    const auto plain_path = dir / kTranscriptFile;

    std::string text;
    if (is_regular(gz_path)) {
        auto packed = core::fs::read_file(gz_path);
        if (core::errors::is_error(packed)) {
            return core::errors::get_error(packed);
        }
        auto unpacked = codec::gzip_decompress(core::errors::get_value(packed));
        if (core::errors::is_error(unpacked)) {
            return StoreError{ErrorCategory::Io,
                              "Compressed transcript is corrupt for run " + run_id + ": " +
                                  core::errors::get_error(unpacked).message,
                              "invalid_transcript"};
        }
        text = core::errors::take_value(std::move(unpacked));
    } else if (is_regular(plain_path)) {
        auto raw = core::fs::read_file(plain_path);
        if (core::errors::is_error(raw)) {
            return core::errors::get_error(raw);
        }
        text = core::errors::take_value(std::move(raw));
    } else {
        return run_not_found(run_id);
    }
    return decode_transcript(text);
}

core::errors::Result<RunMeta> TranscriptStore::load_metadata(const std::string& run_id) const {
    if (const auto run = find_active(run_id)) {
        std::lock_guard<std::mutex> lock(run->mutex);
        if (!run->ended) {
            return run->transcript.meta;
        }
    }

    auto valid = policy::PathGuard::validate_name(run_id);
    if (core::errors::is_error(valid)) {
        return run_not_found(run_id);
    }

    auto meta = read_metadata(run_dir(run_id));
    if (core::errors::is_error(meta) &&
        core::errors::get_error(meta).category == ErrorCategory::NotFound) {
        return run_not_found(run_id);
    }
    return meta;
}

core::errors::Result<std::vector<RunMeta>> TranscriptStore::list(const ListFilter& filter) const {
    std::vector<RunMeta> results;
    const auto runs_dir = base_dir_ / "runs";
    std::error_code ec;
    if (!std::filesystem::is_directory(runs_dir, ec) || ec) {
        return results;
    }

    std::filesystem::directory_iterator it(runs_dir, ec);
    if (ec) {
        return StoreError{ErrorCategory::Io,
                          "Unable to list runs: " + runs_dir.string() + ": " + ec.message(),
                          "run_list_failed"};
    }
    for (; it != std::filesystem::end(it); it.increment(ec)) {
        if (ec) {
            return StoreError{ErrorCategory::Io,
                              "Unable to list runs: " + runs_dir.string() + ": " + ec.message(),
                              "run_list_failed"};
        }
        std::error_code entry_ec;
        if (!it->is_directory(entry_ec) || entry_ec) {
            continue;
        }
        const std::string run_id = it->path().filename().string();
        if (!run_id.empty() && run_id.front() == '.') {
            continue;
        }

        auto meta = load_metadata(run_id);
        if (core::errors::is_error(meta)) {
            LOG_WARN("Skipping run " + run_id + ": " + core::errors::get_error(meta).message);
            continue;
        }
        const RunMeta& m = core::errors::get_value(meta);

        if (!filter.flow_id.empty() && m.flow_id != filter.flow_id) {
            continue;
        }
        if (filter.status.has_value() && m.status != filter.status.value()) {
            continue;
        }
        if (filter.started_after != core::time::TimePoint{} &&
            m.started_at < filter.started_after) {
            continue;
        }
        if (filter.started_before != core::time::TimePoint{} &&
            m.started_at > filter.started_before) {
            continue;
        }
        results.push_back(m);
    }

    std::sort(results.begin(), results.end(), [](const RunMeta& a, const RunMeta& b) {
        if (a.started_at != b.started_at) {
            return a.started_at > b.started_at;
        }
        return a.run_id < b.run_id;
    });
    if (filter.limit > 0 && results.size() > filter.limit) {
        results.resize(filter.limit);
    }
    return results;
}

core::errors::Result<std::string> TranscriptStore::delete_run(const std::string& run_id) {
    auto valid = policy::PathGuard::validate_name(run_id);
    if (core::errors::is_error(valid)) {
        return run_not_found(run_id);
    }

    bool was_active = false;
    if (const auto run = find_active(run_id)) {
        std::lock_guard<std::mutex> lock(run->mutex);
        if (!run->ended) {
            run->ended = true;
            was_active = true;
        }
        forget_active(run_id, run);
    }

    const auto dir = run_dir(run_id);
    std::error_code ec;
    const bool on_disk = std::filesystem::exists(dir, ec);
    if (!on_disk && !was_active) {
        return run_not_found(run_id);
    }
    std::filesystem::remove_all(dir, ec);
    if (ec) {
        return StoreError{ErrorCategory::Io,
                          "Unable to delete run directory: " + dir.string() + ": " + ec.message(),
                          "run_delete_failed"};
    }
    LOG_INFO("Deleted run " + run_id);
    return run_id;
}

std::vector<std::string> TranscriptStore::list_active() const {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(table_mutex_);
        ids.reserve(active_.size());
        for (const auto& entry : active_) {
            ids.push_back(entry.first);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

}  // namespace runvault::session

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/config/store_config.hpp"
#include "core/errors/store_errors.hpp"

namespace runvault::session {

struct CleanupResult {
    std::vector<std::string> archived;
    std::vector<std::string> deleted;
    std::vector<std::string> kept;
    std::vector<std::string> errors;  // "<run_id>: <reason>"
    // Exact for deletions; archives contribute half the run size as an estimate.
    std::uint64_t space_saved = 0;
    // Actual size of the archives written by this pass (0 on a dry run).
    std::uint64_t archived_bytes = 0;
};

struct DiskUsage {
    std::size_t run_count = 0;
    std::size_t archive_count = 0;
    std::uint64_t active_size = 0;
    std::uint64_t archive_size = 0;
    std::uint64_t total_size = 0;  // active_size + archive_size
};

// Ages run directories from <base>/runs into gzip-compressed tar archives
// under <base>/archive/<YYYY-MM>/ and eventually deletes them. Decisions
// use only each run's metadata.json; nothing is cached between calls.
class LifecycleManager {
public:
    explicit LifecycleManager(std::filesystem::path base_dir,
                              core::config::RetentionPolicy policy = {});

    const core::config::RetentionPolicy& policy() const { return policy_; }

    // One retention pass over every run directory, oldest first.
    core::errors::Result<CleanupResult> cleanup(bool dry_run) const;

    // Returns the archive path. The run directory is removed only after the
    // archive is complete and renamed into place.
    core::errors::Result<std::filesystem::path> archive_run(const std::string& run_id) const;

    // Returns the restored run directory. The archive is kept.
    core::errors::Result<std::filesystem::path> restore_archive(const std::string& run_id) const;

    core::errors::Result<std::vector<std::string>> list_archives() const;
    core::errors::Result<std::string> delete_archive(const std::string& run_id) const;
    core::errors::Result<std::uintmax_t> get_archive_size(const std::string& run_id) const;

    // Deletes archives whose modification time is older than
    // archive_retention_days.
    core::errors::Result<CleanupResult> cleanup_archives(bool dry_run) const;

    core::errors::Result<DiskUsage> disk_usage() const;

    std::filesystem::path runs_dir() const;
    std::filesystem::path archive_dir() const;
    // Where archive_run() would place the archive for `run_id`.
    std::filesystem::path archive_path_for(const std::string& run_id) const;

private:
    std::optional<std::filesystem::path> find_archive(const std::string& run_id) const;
    core::errors::Result<std::uint64_t> write_archive(const std::string& run_id,
                                                      const std::filesystem::path& source,
                                                      const std::filesystem::path& target) const;
    core::errors::Result<std::filesystem::path> extract_archive(
        const std::string& run_id, const std::filesystem::path& archive,
        const std::filesystem::path& staging) const;

    std::filesystem::path base_dir_;
    core::config::RetentionPolicy policy_;
};

}  // namespace runvault::session

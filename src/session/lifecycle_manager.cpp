#include "session/lifecycle_manager.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <sys/stat.h>
#include <system_error>
#include <utility>
#include "codec/gzip.hpp"
#include "codec/tar.hpp"
#include "core/config/run_id.hpp"
#include "core/fs/file_io.hpp"
#include "core/logging/logger.hpp"
#include "core/time/timestamp.hpp"
#include "policy/path_guard.hpp"
#include "protocol/transcript_contract.hpp"
#include "session/metadata_codec.hpp"

namespace runvault::session {

using core::errors::ErrorCategory;
using core::errors::StoreError;
using core::time::TimePoint;

namespace {

constexpr const char* kArchiveSuffix = ".tar.gz";

struct RunCandidate {
    std::string run_id;
    protocol::RunMeta meta;
    std::uintmax_t size = 0;
};

bool has_suffix(const std::string& value, const std::string& suffix) {
    return value.size() > suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_hidden(const std::string& filename) {
    return !filename.empty() && filename.front() == '.';
}

std::int64_t unix_seconds(const TimePoint point) {
    return std::chrono::duration_cast<std::chrono::seconds>(point.time_since_epoch()).count();
}

std::uint32_t permission_bits(const std::filesystem::path& path) {
    std::error_code ec;
    const auto status = std::filesystem::symlink_status(path, ec);
    if (ec) {
        return 0644;
    }
    return static_cast<std::uint32_t>(status.permissions() & std::filesystem::perms::mask);
}

StoreError invalid_archive(const std::string& message) {
    return StoreError{ErrorCategory::InvalidArchive, message, "invalid_archive"};
}

// Codec errors that describe a malformed stream surface as invalid_archive.
StoreError as_archive_error(const std::string& run_id, const StoreError& error) {
    if (error.category == ErrorCategory::InvalidArchive) {
        return invalid_archive("Archive for " + run_id + " is corrupt: " + error.message);
    }
    return error;
}

// Sorted list of <run_id>.tar.gz files anywhere under `dir`.
core::errors::Result<std::vector<std::filesystem::path>> archive_files(
    const std::filesystem::path& dir) {
    std::vector<std::filesystem::path> files;
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec) || ec) {
        return files;
    }
    std::filesystem::recursive_directory_iterator it(
        dir, std::filesystem::directory_options::skip_permission_denied, ec);
    for (; !ec && it != std::filesystem::end(it); it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec) || entry_ec) {
            continue;
        }
        const std::string filename = it->path().filename().string();
        if (is_hidden(filename) || !has_suffix(filename, kArchiveSuffix)) {
            continue;
        }
        files.push_back(it->path());
    }
    if (ec) {
        return StoreError{ErrorCategory::Io,
                          "Unable to scan archive directory: " + dir.string() + ": " +
                              ec.message(),
                          "archive_scan_failed"};
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::string archive_run_id(const std::filesystem::path& path) {
    const std::string filename = path.filename().string();
    return filename.substr(0, filename.size() - std::string(kArchiveSuffix).size());
}

// Run directories directly below `runs_dir`, skipping hidden staging dirs.
core::errors::Result<std::vector<std::string>> run_ids(const std::filesystem::path& runs_dir) {
    std::vector<std::string> ids;
    std::error_code ec;
    if (!std::filesystem::is_directory(runs_dir, ec) || ec) {
        return ids;
    }
    std::filesystem::directory_iterator it(runs_dir, ec);
    for (; !ec && it != std::filesystem::end(it); it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_directory(entry_ec) || entry_ec) {
            continue;
        }
        const std::string name = it->path().filename().string();
        if (!is_hidden(name)) {
            ids.push_back(name);
        }
    }
    if (ec) {
        return StoreError{ErrorCategory::Io,
                          "Unable to scan runs directory: " + runs_dir.string() + ": " +
                              ec.message(),
                          "run_scan_failed"};
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

}  // namespace

LifecycleManager::LifecycleManager(std::filesystem::path base_dir,
                                   core::config::RetentionPolicy policy)
    : base_dir_(std::move(base_dir)), policy_(policy) {}

std::filesystem::path LifecycleManager::runs_dir() const {
    return base_dir_ / "runs";
}

std::filesystem::path LifecycleManager::archive_dir() const {
    return base_dir_ / "archive";
}

std::filesystem::path LifecycleManager::archive_path_for(const std::string& run_id) const {
    return archive_dir() / core::config::archive_month_for(run_id) / (run_id + kArchiveSuffix);
}

std::optional<std::filesystem::path> LifecycleManager::find_archive(
    const std::string& run_id) const {
    const auto expected = archive_path_for(run_id);
    std::error_code ec;
    if (std::filesystem::is_regular_file(expected, ec) && !ec) {
        return expected;
    }

    auto files = archive_files(archive_dir());
    if (core::errors::is_error(files)) {
        LOG_WARN(core::errors::get_error(files).message);
        return std::nullopt;
    }
    for (const auto& path : core::errors::get_value(files)) {
        if (archive_run_id(path) == run_id) {
            return path;
        }
    }
    return std::nullopt;
}

core::errors::Result<CleanupResult> LifecycleManager::cleanup(const bool dry_run) const {
    CleanupResult result;
    auto ids = run_ids(runs_dir());
    if (core::errors::is_error(ids)) {
        return core::errors::get_error(ids);
    }

    std::vector<RunCandidate> runs;
    for (const auto& run_id : core::errors::get_value(ids)) {
        const auto dir = runs_dir() / run_id;
        auto meta = read_metadata(dir);
        if (core::errors::is_error(meta)) {
            const auto& error = core::errors::get_error(meta);
            LOG_WARN("Skipping run " + run_id + " during cleanup: " + error.message);
            result.errors.push_back(run_id + ": " + error.message);
            continue;
        }
        runs.push_back(
            RunCandidate{run_id, core::errors::take_value(std::move(meta)),
                         core::fs::directory_size(dir)});
    }

    // Oldest first; a run without an end time sorts before every ended run.
    std::stable_sort(runs.begin(), runs.end(), [](const RunCandidate& a, const RunCandidate& b) {
        return a.meta.ended_at < b.meta.ended_at;
    });

    const auto now = core::time::Clock::now();
    const auto archive_threshold = now - core::time::days(policy_.archive_after_days);
    const auto delete_threshold = now - core::time::days(policy_.retention_days);
    const auto total = static_cast<long long>(runs.size());
    long long removed = 0;

    for (const auto& run : runs) {
        if (run.meta.status == protocol::RunStatus::Running ||
            (policy_.keep_failed && run.meta.status == protocol::RunStatus::Failed)) {
            result.kept.push_back(run.run_id);
            continue;
        }

        const long long remaining_after_this = total - removed - 1;
        if (remaining_after_this < policy_.keep_min_runs) {
            result.kept.push_back(run.run_id);
            continue;
        }

        if (run.meta.ended_at <= delete_threshold) {
            if (!dry_run) {
                std::error_code ec;
                std::filesystem::remove_all(runs_dir() / run.run_id, ec);
                if (ec) {
                    LOG_ERROR("Failed to delete run " + run.run_id + ": " + ec.message());
                    result.errors.push_back(run.run_id + ": delete failed: " + ec.message());
                    continue;
                }
                LOG_INFO("Deleted expired run " + run.run_id);
            }
            result.deleted.push_back(run.run_id);
            result.space_saved += run.size;
            ++removed;
        } else if (run.meta.ended_at <= archive_threshold) {
            if (!dry_run) {
                auto archived = archive_run(run.run_id);
                if (core::errors::is_error(archived)) {
                    const auto& error = core::errors::get_error(archived);
                    result.errors.push_back(run.run_id + ": archive failed: " + error.message);
                    continue;
                }
                std::error_code ec;
                const auto archive_size =
                    std::filesystem::file_size(core::errors::get_value(archived), ec);
                if (!ec) {
                    result.archived_bytes += archive_size;
                }
            }
            result.archived.push_back(run.run_id);
            result.space_saved += run.size / 2;
            ++removed;
        } else {
            result.kept.push_back(run.run_id);
        }
    }

    LOG_INFO(std::string(dry_run ? "Cleanup (dry run): " : "Cleanup: ") +
             std::to_string(result.archived.size()) + " archived, " +
             std::to_string(result.deleted.size()) + " deleted, " +
             std::to_string(result.kept.size()) + " kept, " +
             std::to_string(result.errors.size()) + " errors");
    return result;
}

core::errors::Result<std::uint64_t> LifecycleManager::write_archive(
    const std::string& run_id, const std::filesystem::path& source,
    const std::filesystem::path& target) const {
    std::vector<std::filesystem::path> entries;
    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(source, ec);
    for (; !ec && it != std::filesystem::end(it); it.increment(ec)) {
        entries.push_back(it->path());
    }
    if (ec) {
        return StoreError{ErrorCategory::Io,
                          "Unable to walk run directory: " + source.string() + ": " +
                              ec.message(),
                          "archive_walk_failed"};
    }
    std::sort(entries.begin(), entries.end());

    codec::GzipFileWriter gz;
    auto opened = gz.open(target);
    if (core::errors::is_error(opened)) {
        return core::errors::get_error(opened);
    }
    codec::TarWriter tar(gz);

    auto root = tar.add_directory(run_id, permission_bits(source),
                                  unix_seconds(core::fs::modified_time(source)));
    if (core::errors::is_error(root)) {
        return root;
    }

    for (const auto& path : entries) {
        const std::string name = run_id + "/" + path.lexically_relative(source).generic_string();
        const auto mode = permission_bits(path);
        const auto mtime = unix_seconds(core::fs::modified_time(path));

        std::error_code status_ec;
        const auto status = std::filesystem::symlink_status(path, status_ec);
        if (status_ec) {
            return StoreError{ErrorCategory::Io, "Unable to stat " + path.string(),
                              "archive_walk_failed"};
        }
        core::errors::Result<std::uint64_t> added = std::uint64_t{0};
        if (std::filesystem::is_directory(status)) {
            added = tar.add_directory(name, mode, mtime);
        } else if (std::filesystem::is_regular_file(status)) {
            added = tar.add_file(name, path, mode, mtime);
        } else {
            LOG_WARN("Not archiving special file " + path.string());
            continue;
        }
        if (core::errors::is_error(added)) {
            return added;
        }
    }

    auto finished = tar.finish();
    if (core::errors::is_error(finished)) {
        return finished;
    }
    auto closed = gz.close();
    if (core::errors::is_error(closed)) {
        return core::errors::get_error(closed);
    }
    return tar.bytes_written();
}

core::errors::Result<std::filesystem::path> LifecycleManager::archive_run(
    const std::string& run_id) const {
    auto valid = policy::PathGuard::validate_name(run_id);
    if (core::errors::is_error(valid)) {
        return StoreError{ErrorCategory::Input, "Invalid run id: '" + run_id + "'",
                          "invalid_run_id"};
    }

    const auto source = runs_dir() / run_id;
    std::error_code ec;
    if (!std::filesystem::is_directory(source, ec) || ec) {
        return StoreError{ErrorCategory::NotFound, "Run not found: " + run_id, "run_not_found"};
    }
    if (const auto existing = find_archive(run_id)) {
        return StoreError{ErrorCategory::AlreadyExists,
                          "Archive already exists for run " + run_id + ": " +
                              existing->string(),
                          "archive_exists"};
    }

    const auto target = archive_path_for(run_id);
    auto bucket = core::fs::ensure_dir(target.parent_path());
    if (core::errors::is_error(bucket)) {
        return core::errors::get_error(bucket);
    }

    const auto partial = core::fs::temp_sibling(target, "partial");
    auto written = write_archive(run_id, source, partial);
    if (core::errors::is_error(written)) {
        std::error_code ignored;
        std::filesystem::remove(partial, ignored);
        LOG_ERROR("Archiving " + run_id + " failed: " + core::errors::get_error(written).message);
        return core::errors::get_error(written);
    }

    std::filesystem::rename(partial, target, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(partial, ignored);
        return StoreError{ErrorCategory::Io,
                          "Unable to move archive into place: " + target.string() + ": " +
                              ec.message(),
                          "archive_rename_failed"};
    }

    std::filesystem::remove_all(source, ec);
    if (ec) {
        // The archive is complete, so it is kept even though the source could
        // not be fully removed.
        LOG_ERROR("Archived " + run_id + " but could not remove " + source.string() + ": " +
                  ec.message());
        return StoreError{ErrorCategory::Io,
                          "Archived run but failed to remove its directory: " + ec.message(),
                          "run_remove_failed"};
    }

    LOG_INFO("Archived run " + run_id + " to " + target.string());
    return target;
}

core::errors::Result<std::filesystem::path> LifecycleManager::extract_archive(
    const std::string& run_id, const std::filesystem::path& archive,
    const std::filesystem::path& staging) const {
    codec::GzipFileReader gz;
    auto opened = gz.open(archive);
    if (core::errors::is_error(opened)) {
        return as_archive_error(run_id, core::errors::get_error(opened));
    }
    codec::TarReader tar(gz);

    std::vector<std::pair<std::filesystem::path, std::uint32_t>> directory_modes;
    while (true) {
        auto next = tar.next();
        if (core::errors::is_error(next)) {
            return as_archive_error(run_id, core::errors::get_error(next));
        }
        const auto& entry = core::errors::get_value(next);
        if (!entry.has_value()) {
            break;
        }

        const std::string& name = entry->name;
        if (name.empty() || name.front() == '/') {
            return invalid_archive("Archive entry has an absolute or empty path: '" + name + "'");
        }
        auto resolved = policy::PathGuard::resolve_within(staging, name);
        if (core::errors::is_error(resolved)) {
            return invalid_archive("Archive entry escapes the run directory: '" + name + "'");
        }
        const auto relative = std::filesystem::path(name).lexically_normal();
        if (relative.empty() || *relative.begin() != run_id) {
            return invalid_archive("Archive entry is outside '" + run_id + "/': '" + name + "'");
        }
        const auto& dest = core::errors::get_value(resolved);

        if (entry->type == codec::TarEntryType::Directory) {
            auto created = core::fs::ensure_dir(dest);
            if (core::errors::is_error(created)) {
                return core::errors::get_error(created);
            }
            directory_modes.emplace_back(dest, entry->mode);
            continue;
        }
        if (entry->type == codec::TarEntryType::Other) {
            LOG_WARN("Skipping unsupported archive entry '" + name + "'");
            continue;
        }

        auto parent = core::fs::ensure_dir(dest.parent_path());
        if (core::errors::is_error(parent)) {
            return core::errors::get_error(parent);
        }
        std::ofstream out(dest, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return StoreError{ErrorCategory::Io, "Unable to create " + dest.string(),
                              "restore_write_failed"};
        }
        auto copied = tar.copy_data(out);
        if (core::errors::is_error(copied)) {
            return as_archive_error(run_id, core::errors::get_error(copied));
        }
        out.close();
        if (out.fail()) {
            return StoreError{ErrorCategory::Io, "Unable to write " + dest.string(),
                              "restore_write_failed"};
        }
        if (::chmod(dest.c_str(), static_cast<mode_t>(entry->mode & 07777U)) != 0) {
            LOG_WARN("Could not restore permissions on " + dest.string());
        }
    }

    // Applied last so read-only directories do not block extraction.
    for (auto it = directory_modes.rbegin(); it != directory_modes.rend(); ++it) {
        const auto mode = static_cast<mode_t>((it->second & 07777U) | 0700U);
        if (::chmod(it->first.c_str(), mode) != 0) {
            LOG_WARN("Could not restore permissions on " + it->first.string());
        }
    }

    const auto restored = staging / run_id;
    std::error_code ec;
    if (!std::filesystem::is_directory(restored, ec) || ec) {
        return invalid_archive("Archive does not contain a '" + run_id + "/' directory");
    }
    return restored;
}

core::errors::Result<std::filesystem::path> LifecycleManager::restore_archive(
    const std::string& run_id) const {
    auto valid = policy::PathGuard::validate_name(run_id);
    if (core::errors::is_error(valid)) {
        return StoreError{ErrorCategory::Input, "Invalid run id: '" + run_id + "'",
                          "invalid_run_id"};
    }

    const auto archive = find_archive(run_id);
    if (!archive.has_value()) {
        return StoreError{ErrorCategory::NotFound, "Archive not found for run " + run_id,
                          "archive_not_found"};
    }

    const auto target = runs_dir() / run_id;
    std::error_code ec;
    if (std::filesystem::exists(target, ec)) {
        return StoreError{ErrorCategory::AlreadyExists,
                          "Run directory already exists: " + target.string(),
                          "run_already_exists", "Delete or archive the existing run first."};
    }

    auto runs = core::fs::ensure_dir(runs_dir());
    if (core::errors::is_error(runs)) {
        return core::errors::get_error(runs);
    }
    const auto staging = core::fs::temp_sibling(target, "restore");
    auto created = core::fs::ensure_dir(staging);
    if (core::errors::is_error(created)) {
        return core::errors::get_error(created);
    }

    auto extracted = extract_archive(run_id, archive.value(), staging);
    if (core::errors::is_error(extracted)) {
        std::error_code ignored;
        std::filesystem::remove_all(staging, ignored);
        LOG_ERROR("Restore of " + run_id + " failed: " +
                  core::errors::get_error(extracted).message);
        return core::errors::get_error(extracted);
    }

    std::filesystem::rename(core::errors::get_value(extracted), target, ec);
    std::error_code ignored;
    if (ec) {
        std::filesystem::remove_all(staging, ignored);
        return StoreError{ErrorCategory::Io,
                          "Unable to move restored run into place: " + target.string() + ": " +
                              ec.message(),
                          "restore_rename_failed"};
    }
    std::filesystem::remove_all(staging, ignored);

    LOG_INFO("Restored run " + run_id + " from " + archive->string());
    return target;
}

core::errors::Result<std::vector<std::string>> LifecycleManager::list_archives() const {
    auto files = archive_files(archive_dir());
    if (core::errors::is_error(files)) {
        return core::errors::get_error(files);
    }
    std::vector<std::string> ids;
    for (const auto& path : core::errors::get_value(files)) {
        ids.push_back(archive_run_id(path));
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

core::errors::Result<std::string> LifecycleManager::delete_archive(
    const std::string& run_id) const {
    const auto archive = find_archive(run_id);
    if (!archive.has_value()) {
        return StoreError{ErrorCategory::NotFound, "Archive not found for run " + run_id,
                          "archive_not_found"};
    }
    std::error_code ec;
    std::filesystem::remove(archive.value(), ec);
    if (ec) {
        return StoreError{ErrorCategory::Io,
                          "Unable to delete archive " + archive->string() + ": " + ec.message(),
                          "archive_delete_failed"};
    }
    LOG_INFO("Deleted archive " + archive->string());
    return run_id;
}

core::errors::Result<std::uintmax_t> LifecycleManager::get_archive_size(
    const std::string& run_id) const {
    const auto archive = find_archive(run_id);
    if (!archive.has_value()) {
        return StoreError{ErrorCategory::NotFound, "Archive not found for run " + run_id,
                          "archive_not_found"};
    }
    std::error_code ec;
    const auto size = std::filesystem::file_size(archive.value(), ec);
    if (ec) {
        return StoreError{ErrorCategory::Io,
                          "Unable to stat archive " + archive->string() + ": " + ec.message(),
                          "archive_stat_failed"};
    }
    return size;
}

core::errors::Result<CleanupResult> LifecycleManager::cleanup_archives(const bool dry_run) const {
    CleanupResult result;
    auto files = archive_files(archive_dir());
    if (core::errors::is_error(files)) {
        return core::errors::get_error(files);
    }

    const auto threshold =
        core::time::Clock::now() - core::time::days(policy_.archive_retention_days);
    for (const auto& path : core::errors::get_value(files)) {
        const std::string run_id = archive_run_id(path);
        std::error_code ec;
        const auto size = std::filesystem::file_size(path, ec);
        if (ec) {
            result.errors.push_back(run_id + ": " + ec.message());
            continue;
        }
        if (core::fs::modified_time(path) >= threshold) {
            result.kept.push_back(run_id);
            continue;
        }
        if (!dry_run) {
            std::filesystem::remove(path, ec);
            if (ec) {
                LOG_ERROR("Failed to delete archive " + path.string() + ": " + ec.message());
                result.errors.push_back(run_id + ": delete archive failed: " + ec.message());
                continue;
            }
            LOG_INFO("Deleted expired archive " + path.string());
        }
        result.deleted.push_back(run_id);
        result.space_saved += size;
    }
    return result;
}

core::errors::Result<DiskUsage> LifecycleManager::disk_usage() const {
    DiskUsage usage;
    auto ids = run_ids(runs_dir());
    if (core::errors::is_error(ids)) {
        return core::errors::get_error(ids);
    }
    for (const auto& run_id : core::errors::get_value(ids)) {
        ++usage.run_count;
        usage.active_size += core::fs::directory_size(runs_dir() / run_id);
    }

    auto files = archive_files(archive_dir());
    if (core::errors::is_error(files)) {
        return core::errors::get_error(files);
    }
    for (const auto& path : core::errors::get_value(files)) {
        std::error_code ec;
        const auto size = std::filesystem::file_size(path, ec);
        if (ec) {
            continue;
        }
        ++usage.archive_count;
        usage.archive_size += size;
    }
    usage.total_size = usage.active_size + usage.archive_size;
    return usage;
}

}  // namespace runvault::session

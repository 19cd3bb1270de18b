#include "session/artifact_manager.hpp"

#include <algorithm>
#include <map>
#include <system_error>
#include <utility>
#include "codec/gzip.hpp"
#include "session/metadata_codec.hpp"
#include "core/fs/file_io.hpp"
#include "core/logging/logger.hpp"
#include "policy/path_guard.hpp"

namespace runvault::session {

using core::errors::ErrorCategory;
using core::errors::StoreError;
using nlohmann::json;

namespace {

constexpr const char* kRunsDir = "runs";
constexpr const char* kArtifactsDir = "artifacts";
constexpr const char* kFilesDir = "files";

std::filesystem::path with_gz(const std::filesystem::path& path) {
    return std::filesystem::path(path.string() + ".gz");
}

bool is_regular(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && !ec;
}

// Temp files left behind by an interrupted atomic write.
bool is_temp_name(const std::string& filename) {
    return !filename.empty() && filename.front() == '.' &&
           filename.find(".tmp-") != std::string::npos;
}

StoreError artifact_not_found(const std::string& run_id, const std::string& name) {
    return StoreError{ErrorCategory::NotFound,
                      "Artifact '" + name + "' not found for run " + run_id,
                      "artifact_not_found"};
}

template <typename T>
core::errors::Result<T> decode_artifact_json(
    const core::errors::Result<std::string>& raw,
    core::errors::Result<T> (*decode)(const json&)) {
    if (core::errors::is_error(raw)) {
        return core::errors::get_error(raw);
    }
    json doc;
    try {
        doc = json::parse(core::errors::get_value(raw));
    } catch (const json::parse_error& e) {
        return StoreError{ErrorCategory::Input,
                          std::string("Artifact is not valid JSON: ") + e.what(),
                          "invalid_artifact_json"};
    }
    return decode(doc);
}

}  // namespace

ArtifactManager::ArtifactManager(std::filesystem::path base_dir, const std::size_t compress_above)
    : base_dir_(std::move(base_dir)), compress_above_(compress_above) {}

std::filesystem::path ArtifactManager::run_dir(const std::string& run_id) const {
    return base_dir_ / kRunsDir / run_id;
}

std::filesystem::path ArtifactManager::artifact_dir(const std::string& run_id) const {
    return run_dir(run_id) / kArtifactsDir;
}

std::filesystem::path ArtifactManager::files_dir(const std::string& run_id) const {
    return run_dir(run_id) / kFilesDir;
}

core::errors::Result<std::filesystem::path> ArtifactManager::ensure_run_dir(
    const std::string& run_id) const {
    auto valid = policy::PathGuard::validate_name(run_id);
    if (core::errors::is_error(valid)) {
        return StoreError{ErrorCategory::Input, "Invalid run id: '" + run_id + "'",
                          "invalid_run_id"};
    }
    auto created = core::fs::ensure_dir(artifact_dir(run_id));
    if (core::errors::is_error(created)) {
        return core::errors::get_error(created);
    }
    return run_dir(run_id);
}

core::errors::Result<std::filesystem::path> ArtifactManager::resolve_artifact(
    const std::string& run_id, const std::string& name) const {
    auto valid_run = policy::PathGuard::validate_name(run_id);
    if (core::errors::is_error(valid_run)) {
        return StoreError{ErrorCategory::Input, "Invalid run id: '" + run_id + "'",
                          "invalid_run_id"};
    }
    auto resolved = policy::PathGuard::resolve_within(artifact_dir(run_id), name);
    if (core::errors::is_error(resolved)) {
        return StoreError{ErrorCategory::Input,
                          "Invalid artifact name '" + name + "': " +
                              core::errors::get_error(resolved).message,
                          "invalid_artifact_name"};
    }
    // The .gz suffix marks the compressed storage form.
    const std::string suffix = kGzipSuffix;
    if (name.size() >= suffix.size() &&
        name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
        return StoreError{ErrorCategory::Input,
                          "Invalid artifact name '" + name + "': the " + suffix +
                              " suffix is reserved for compressed storage",
                          "invalid_artifact_name",
                          "Store pre-compressed payloads with save_file instead."};
    }
    return resolved;
}

core::errors::Result<std::filesystem::path> ArtifactManager::resolve_file(
    const std::string& run_id, const std::string& relative_path) const {
    auto valid_run = policy::PathGuard::validate_name(run_id);
    if (core::errors::is_error(valid_run)) {
        return StoreError{ErrorCategory::Input, "Invalid run id: '" + run_id + "'",
                          "invalid_run_id"};
    }
    auto resolved = policy::PathGuard::resolve_within(files_dir(run_id), relative_path);
    if (core::errors::is_error(resolved)) {
        return StoreError{ErrorCategory::Input,
                          "Invalid file path '" + relative_path + "': " +
                              core::errors::get_error(resolved).message,
                          "invalid_file_path"};
    }
    return resolved;
}

core::errors::Result<std::filesystem::path> ArtifactManager::save_artifact(
    const std::string& run_id, const std::string& name, const std::string& content) const {
    auto resolved = resolve_artifact(run_id, name);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const auto plain_path = core::errors::get_value(resolved);
    const auto gz_path = with_gz(plain_path);

    auto run = ensure_run_dir(run_id);
    if (core::errors::is_error(run)) {
        return core::errors::get_error(run);
    }
    auto parent = core::fs::ensure_dir(plain_path.parent_path());
    if (core::errors::is_error(parent)) {
        return core::errors::get_error(parent);
    }

    const bool compress = content.size() > compress_above_;
    std::filesystem::path target = plain_path;
    std::filesystem::path stale = gz_path;
    core::errors::Result<std::filesystem::path> written = plain_path;
    if (compress) {
        auto packed = codec::gzip_compress(content);
        if (core::errors::is_error(packed)) {
            return core::errors::get_error(packed);
        }
        target = gz_path;
        stale = plain_path;
        written = core::fs::write_file_atomic(target, core::errors::get_value(packed));
    } else {
        written = core::fs::write_file_atomic(target, content);
    }
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }

    auto removed = core::fs::remove_file_if_exists(stale);
    if (core::errors::is_error(removed)) {
        return core::errors::get_error(removed);
    }

    LOG_DEBUG("Saved artifact " + run_id + "/" + name + " (" + std::to_string(content.size()) +
              " bytes" + (compress ? ", compressed)" : ")"));
    return target;
}

core::errors::Result<std::string> ArtifactManager::load_artifact(const std::string& run_id,
                                                                 const std::string& name) const {
    auto resolved = resolve_artifact(run_id, name);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const auto plain_path = core::errors::get_value(resolved);
    const auto gz_path = with_gz(plain_path);

    if (is_regular(gz_path)) {
        auto packed = core::fs::read_file(gz_path);
        if (core::errors::is_error(packed)) {
            return core::errors::get_error(packed);
        }
        return codec::gzip_decompress(core::errors::get_value(packed));
    }
    if (is_regular(plain_path)) {
        return core::fs::read_file(plain_path);
    }
    return artifact_not_found(run_id, name);
}

core::errors::Result<std::vector<ArtifactInfo>> ArtifactManager::list_artifacts(
    const std::string& run_id) const {
    auto valid_run = policy::PathGuard::validate_name(run_id);
    if (core::errors::is_error(valid_run)) {
        return StoreError{ErrorCategory::Input, "Invalid run id: '" + run_id + "'",
                          "invalid_run_id"};
    }

    const auto dir = artifact_dir(run_id);
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec) || ec) {
        return std::vector<ArtifactInfo>{};
    }

    std::map<std::string, ArtifactInfo> by_name;
    std::filesystem::recursive_directory_iterator it(dir, ec);
    if (ec) {
        return StoreError{ErrorCategory::Io,
                          "Unable to list artifacts: " + dir.string() + ": " + ec.message(),
                          "artifact_list_failed"};
    }
    for (; it != std::filesystem::end(it); it.increment(ec)) {
        if (ec) {
            return StoreError{ErrorCategory::Io,
                              "Unable to list artifacts: " + dir.string() + ": " + ec.message(),
                              "artifact_list_failed"};
        }
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec) || entry_ec) {
            continue;
        }
        const auto& path = it->path();
        if (is_temp_name(path.filename().string())) {
            continue;
        }

        ArtifactInfo info;
        info.name = path.lexically_relative(dir).generic_string();
        if (info.name.size() > 3 && info.name.compare(info.name.size() - 3, 3, ".gz") == 0) {
            info.name.resize(info.name.size() - 3);
            info.compressed = true;
        }
        info.type = infer_artifact_type(info.name);
        info.size = it->file_size(entry_ec);
        if (entry_ec) {
            info.size = 0;
        }
        info.modified_at = core::fs::modified_time(path);

        auto existing = by_name.find(info.name);
        if (existing != by_name.end() && existing->second.compressed) {
            continue;
        }
        by_name[info.name] = info;
    }

    std::vector<ArtifactInfo> artifacts;
    artifacts.reserve(by_name.size());
    for (auto& entry : by_name) {
        artifacts.push_back(std::move(entry.second));
    }
    return artifacts;
}

bool ArtifactManager::has_artifact(const std::string& run_id, const std::string& name) const {
    auto resolved = resolve_artifact(run_id, name);
    if (core::errors::is_error(resolved)) {
        return false;
    }
    const auto& path = core::errors::get_value(resolved);
    return is_regular(with_gz(path)) || is_regular(path);
}

core::errors::Result<std::string> ArtifactManager::delete_artifact(
    const std::string& run_id, const std::string& name) const {
    auto resolved = resolve_artifact(run_id, name);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const auto& path = core::errors::get_value(resolved);

    auto removed_gz = core::fs::remove_file_if_exists(with_gz(path));
    if (core::errors::is_error(removed_gz)) {
        return core::errors::get_error(removed_gz);
    }
    auto removed_plain = core::fs::remove_file_if_exists(path);
    if (core::errors::is_error(removed_plain)) {
        return core::errors::get_error(removed_plain);
    }
    if (!core::errors::get_value(removed_gz) && !core::errors::get_value(removed_plain)) {
        return artifact_not_found(run_id, name);
    }
    return name;
}

core::errors::Result<ArtifactInfo> ArtifactManager::get_artifact_info(
    const std::string& run_id, const std::string& name) const {
    auto resolved = resolve_artifact(run_id, name);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const auto& plain_path = core::errors::get_value(resolved);

    ArtifactInfo info;
    info.name = name;
    info.type = infer_artifact_type(name);

    std::filesystem::path found;
    if (is_regular(with_gz(plain_path))) {
        found = with_gz(plain_path);
        info.compressed = true;
    } else if (is_regular(plain_path)) {
        found = plain_path;
    } else {
        return artifact_not_found(run_id, name);
    }

    std::error_code ec;
    info.size = std::filesystem::file_size(found, ec);
    if (ec) {
        return StoreError{ErrorCategory::Io,
                          "Unable to stat artifact: " + found.string() + ": " + ec.message(),
                          "artifact_stat_failed"};
    }
    info.modified_at = core::fs::modified_time(found);
    return info;
}

core::errors::Result<std::filesystem::path> ArtifactManager::save_file(
    const std::string& run_id, const std::string& relative_path,
    const std::string& content) const {
    auto resolved = resolve_file(run_id, relative_path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const auto& path = core::errors::get_value(resolved);
    auto parent = core::fs::ensure_dir(path.parent_path());
    if (core::errors::is_error(parent)) {
        return core::errors::get_error(parent);
    }
    return core::fs::write_file_atomic(path, content);
}

core::errors::Result<std::string> ArtifactManager::load_file(
    const std::string& run_id, const std::string& relative_path) const {
    auto resolved = resolve_file(run_id, relative_path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    auto content = core::fs::read_file(core::errors::get_value(resolved));
    if (core::errors::is_error(content) &&
        core::errors::get_error(content).category == ErrorCategory::NotFound) {
        return StoreError{ErrorCategory::NotFound,
                          "File '" + relative_path + "' not found for run " + run_id,
                          "file_not_found"};
    }
    return content;
}

core::errors::Result<std::vector<std::string>> ArtifactManager::list_files(
    const std::string& run_id) const {
    auto valid_run = policy::PathGuard::validate_name(run_id);
    if (core::errors::is_error(valid_run)) {
        return StoreError{ErrorCategory::Input, "Invalid run id: '" + run_id + "'",
                          "invalid_run_id"};
    }

    std::vector<std::string> files;
    const auto dir = files_dir(run_id);
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec) || ec) {
        return files;
    }
    std::filesystem::recursive_directory_iterator it(dir, ec);
    for (; !ec && it != std::filesystem::end(it); it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec) || entry_ec ||
            is_temp_name(it->path().filename().string())) {
            continue;
        }
        files.push_back(it->path().lexically_relative(dir).generic_string());
    }
    if (ec) {
        return StoreError{ErrorCategory::Io,
                          "Unable to list files: " + dir.string() + ": " + ec.message(),
                          "file_list_failed"};
    }
    std::sort(files.begin(), files.end());
    return files;
}

core::errors::Result<std::filesystem::path> ArtifactManager::save_spec(
    const std::string& run_id, const std::string& spec) const {
    return save_artifact(run_id, kSpecArtifact, spec);
}

core::errors::Result<std::string> ArtifactManager::load_spec(const std::string& run_id) const {
    return load_artifact(run_id, kSpecArtifact);
}

core::errors::Result<std::filesystem::path> ArtifactManager::save_review(
    const std::string& run_id, const ReviewResult& review) const {
    return save_artifact(run_id, kReviewArtifact, dump_json(to_json(review)));
}

core::errors::Result<ReviewResult> ArtifactManager::load_review(const std::string& run_id) const {
    return decode_artifact_json<ReviewResult>(load_artifact(run_id, kReviewArtifact),
                                              &review_from_json);
}

core::errors::Result<std::filesystem::path> ArtifactManager::save_test_output(
    const std::string& run_id, const TestOutput& output) const {
    return save_artifact(run_id, kTestOutputArtifact, dump_json(to_json(output)));
}

core::errors::Result<TestOutput> ArtifactManager::load_test_output(
    const std::string& run_id) const {
    return decode_artifact_json<TestOutput>(load_artifact(run_id, kTestOutputArtifact),
                                            &test_output_from_json);
}

core::errors::Result<std::filesystem::path> ArtifactManager::save_lint_output(
    const std::string& run_id, const LintOutput& output) const {
    return save_artifact(run_id, kLintOutputArtifact, dump_json(to_json(output)));
}

core::errors::Result<LintOutput> ArtifactManager::load_lint_output(
    const std::string& run_id) const {
    return decode_artifact_json<LintOutput>(load_artifact(run_id, kLintOutputArtifact),
                                            &lint_output_from_json);
}

core::errors::Result<std::filesystem::path> ArtifactManager::save_diff(
    const std::string& run_id, const std::string& diff) const {
    return save_artifact(run_id, kDiffArtifact, diff);
}

core::errors::Result<std::string> ArtifactManager::load_diff(const std::string& run_id) const {
    return load_artifact(run_id, kDiffArtifact);
}

core::errors::Result<std::filesystem::path> ArtifactManager::save_json(
    const std::string& run_id, const std::string& name, const json& value) const {
    return save_artifact(run_id, name, dump_json(value));
}

core::errors::Result<json> ArtifactManager::load_json(const std::string& run_id,
                                                      const std::string& name) const {
    auto raw = load_artifact(run_id, name);
    if (core::errors::is_error(raw)) {
        return core::errors::get_error(raw);
    }
    try {
        return json::parse(core::errors::get_value(raw));
    } catch (const json::parse_error& e) {
        return StoreError{ErrorCategory::Input,
                          "Artifact '" + name + "' is not valid JSON: " + e.what(),
                          "invalid_artifact_json"};
    }
}

}  // namespace runvault::session

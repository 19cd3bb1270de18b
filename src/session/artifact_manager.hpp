#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/store_config.hpp"
#include "core/errors/store_errors.hpp"
#include "core/time/timestamp.hpp"
#include "session/artifact_types.hpp"

namespace runvault::session {

struct ArtifactInfo {
    std::string name;  // relative to the artifact directory, without ".gz"
    ArtifactType type = ArtifactType::Unknown;
    std::uintmax_t size = 0;  // bytes on disk
    bool compressed = false;
    core::time::TimePoint modified_at{};
};

// Named blobs under <base>/runs/<run_id>/artifacts/. Payloads larger than
// the compression threshold are stored as "<name>.gz"; at most one of the
// two physical forms exists after any successful save.
class ArtifactManager {
public:
    explicit ArtifactManager(std::filesystem::path base_dir,
                             std::size_t compress_above = core::config::kArtifactCompressAbove);

    const std::filesystem::path& base_dir() const { return base_dir_; }
    std::filesystem::path run_dir(const std::string& run_id) const;
    std::filesystem::path artifact_dir(const std::string& run_id) const;
    std::filesystem::path files_dir(const std::string& run_id) const;

    core::errors::Result<std::filesystem::path> ensure_run_dir(const std::string& run_id) const;

    // Returns the path of the physical file written.
    core::errors::Result<std::filesystem::path> save_artifact(const std::string& run_id,
                                                              const std::string& name,
                                                              const std::string& content) const;
    core::errors::Result<std::string> load_artifact(const std::string& run_id,
                                                    const std::string& name) const;
    core::errors::Result<std::vector<ArtifactInfo>> list_artifacts(
        const std::string& run_id) const;
    bool has_artifact(const std::string& run_id, const std::string& name) const;
    core::errors::Result<std::string> delete_artifact(const std::string& run_id,
                                                      const std::string& name) const;
    core::errors::Result<ArtifactInfo> get_artifact_info(const std::string& run_id,
                                                         const std::string& name) const;

    // Auxiliary files under runs/<run_id>/files/, stored uncompressed.
    core::errors::Result<std::filesystem::path> save_file(const std::string& run_id,
                                                          const std::string& relative_path,
                                                          const std::string& content) const;
    core::errors::Result<std::string> load_file(const std::string& run_id,
                                                const std::string& relative_path) const;
    core::errors::Result<std::vector<std::string>> list_files(const std::string& run_id) const;

    core::errors::Result<std::filesystem::path> save_spec(const std::string& run_id,
                                                          const std::string& spec) const;
    core::errors::Result<std::string> load_spec(const std::string& run_id) const;
    core::errors::Result<std::filesystem::path> save_review(const std::string& run_id,
                                                            const ReviewResult& review) const;
    core::errors::Result<ReviewResult> load_review(const std::string& run_id) const;
    core::errors::Result<std::filesystem::path> save_test_output(const std::string& run_id,
                                                                 const TestOutput& output) const;
    core::errors::Result<TestOutput> load_test_output(const std::string& run_id) const;
    core::errors::Result<std::filesystem::path> save_lint_output(const std::string& run_id,
                                                                 const LintOutput& output) const;
    core::errors::Result<LintOutput> load_lint_output(const std::string& run_id) const;
    core::errors::Result<std::filesystem::path> save_diff(const std::string& run_id,
                                                          const std::string& diff) const;
    core::errors::Result<std::string> load_diff(const std::string& run_id) const;
    core::errors::Result<std::filesystem::path> save_json(const std::string& run_id,
                                                          const std::string& name,
                                                          const nlohmann::json& value) const;
    core::errors::Result<nlohmann::json> load_json(const std::string& run_id,
                                                   const std::string& name) const;

private:
    core::errors::Result<std::filesystem::path> resolve_artifact(const std::string& run_id,
                                                                 const std::string& name) const;
    core::errors::Result<std::filesystem::path> resolve_file(
        const std::string& run_id, const std::string& relative_path) const;

    std::filesystem::path base_dir_;
    std::size_t compress_above_;
};

}  // namespace runvault::session

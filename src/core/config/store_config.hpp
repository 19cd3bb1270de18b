#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include "core/errors/store_errors.hpp"
#include "core/logging/logger.hpp"

namespace runvault::core::config {

constexpr std::size_t kArtifactCompressAbove = 10 * 1024;
constexpr std::size_t kTranscriptCompressAbove = 100 * 1024;

struct RetentionPolicy {
    int retention_days = 30;          // delete active runs older than this
    int archive_after_days = 7;       // archive active runs older than this
    int archive_retention_days = 90;  // delete archives older than this
    bool keep_failed = true;
    int keep_min_runs = 100;          // floor on runs surviving a cleanup pass
};

struct StoreConfig {
    std::filesystem::path base_dir = ".runvault";
    std::size_t artifact_compress_above = kArtifactCompressAbove;
    std::size_t transcript_compress_above = kTranscriptCompressAbove;
    RetentionPolicy retention;
    logging::LogLevel log_level = logging::LogLevel::INFO;
};

// Parses the JSON configuration document. Missing keys keep their defaults,
// unknown keys are ignored, wrong types and negative values are rejected.
core::errors::Result<StoreConfig> parse_store_config(const std::string& json_text);

core::errors::Result<StoreConfig> load_store_config(const std::filesystem::path& path);

}  // namespace runvault::core::config

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include "core/errors/store_errors.hpp"
#include "core/time/timestamp.hpp"

namespace runvault::core::fs {

// Reads the whole file in binary mode. A missing file is a NotFound error
// with code "file_not_found".
core::errors::Result<std::string> read_file(const std::filesystem::path& path);

// Writes through a sibling temp file and renames it over `path`, so readers
// never observe a partially written file.
core::errors::Result<std::filesystem::path> write_file_atomic(
    const std::filesystem::path& path, const std::string& content);

core::errors::Result<std::filesystem::path> ensure_dir(const std::filesystem::path& path);

// Sum of regular file sizes below `path`; unreadable entries are skipped.
std::uintmax_t directory_size(const std::filesystem::path& path);

// Returns true when a file was removed; a missing file is not an error.
core::errors::Result<bool> remove_file_if_exists(const std::filesystem::path& path);

// Last write time, or TimePoint{} when it cannot be read.
core::time::TimePoint modified_time(const std::filesystem::path& path);

// Unique sibling name used for temp files and directories.
std::filesystem::path temp_sibling(const std::filesystem::path& path,
                                   const std::string& tag);

}  // namespace runvault::core::fs

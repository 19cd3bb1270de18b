#include "core/fs/file_io.hpp"

#include <chrono>
#include <fstream>
#include <random>
#include <sstream>
#include <system_error>

namespace runvault::core::fs {

using core::errors::ErrorCategory;
using core::errors::StoreError;

std::filesystem::path temp_sibling(const std::filesystem::path& path,
                                   const std::string& tag) {
    static thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<std::uint64_t> dis;

    std::ostringstream name;
    name << "." << path.filename().string() << "." << tag << "-" << std::hex << dis(gen);
    return path.parent_path() / name.str();
}

core::errors::Result<std::string> read_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return StoreError{ErrorCategory::NotFound, "File does not exist: " + path.string(),
                          "file_not_found"};
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return StoreError{ErrorCategory::Io, "Unable to open file: " + path.string(),
                          "file_open_failed"};
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return StoreError{ErrorCategory::Io, "I/O error while reading file: " + path.string(),
                          "file_read_failed"};
    }
    return buffer.str();
}

core::errors::Result<std::filesystem::path> write_file_atomic(
    const std::filesystem::path& path, const std::string& content) {
    const auto temp_path = temp_sibling(path, "tmp");
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return StoreError{ErrorCategory::Io, "Unable to open file: " + temp_path.string(),
                              "file_open_failed"};
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out.good()) {
            out.close();
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            return StoreError{ErrorCategory::Io, "Unable to write file: " + path.string(),
                              "file_write_failed"};
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return StoreError{ErrorCategory::Io,
                          "Unable to move file into place: " + path.string() + ": " +
                              ec.message(),
                          "file_rename_failed"};
    }
    return path;
}

core::errors::Result<std::filesystem::path> ensure_dir(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        return StoreError{ErrorCategory::Io,
                          "Unable to create directory: " + path.string() + ": " + ec.message(),
                          "dir_create_failed"};
    }
    if (!std::filesystem::is_directory(path, ec) || ec) {
        return StoreError{ErrorCategory::Io, "Path is not a directory: " + path.string(),
                          "dir_create_failed"};
    }
    return path;
}

std::uintmax_t directory_size(const std::filesystem::path& path) {
    std::uintmax_t total = 0;
    std::error_code ec;
    const auto options = std::filesystem::directory_options::skip_permission_denied;
    std::filesystem::recursive_directory_iterator it(path, options, ec);
    if (ec) {
        return 0;
    }
    for (; it != std::filesystem::end(it); it.increment(ec)) {
        if (ec) {
            break;
        }
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec) || entry_ec) {
            continue;
        }
        const auto size = it->file_size(entry_ec);
        if (!entry_ec) {
            total += size;
        }
    }
    return total;
}

core::errors::Result<bool> remove_file_if_exists(const std::filesystem::path& path) {
    std::error_code ec;
    const bool removed = std::filesystem::remove(path, ec);
    if (ec) {
        return StoreError{ErrorCategory::Io,
                          "Unable to remove file: " + path.string() + ": " + ec.message(),
                          "file_remove_failed"};
    }
    return removed;
}

core::time::TimePoint modified_time(const std::filesystem::path& path) {
    std::error_code ec;
    const auto file_time = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return core::time::TimePoint{};
    }
    // file_time_type has no portable conversion in C++17; rebase on both clocks' now().
    const auto delta = file_time - std::filesystem::file_time_type::clock::now();
    return core::time::Clock::now() +
           std::chrono::duration_cast<core::time::Clock::duration>(delta);
}

}  // namespace runvault::core::fs

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include "codec/gzip.hpp"
#include "core/errors/store_errors.hpp"

namespace runvault::codec {

// POSIX ustar archive reader/writer layered on the gzip file streams.
//
// Contract:
// - Entry names use '/' separators. Names longer than the ustar name/prefix
//   split allows are written with a GNU long-name record.
// - The reader understands ustar, GNU long names and PAX "path" records; any
//   other entry kind is surfaced as TarEntryType::Other.
// - Header checksum mismatches and short reads are InvalidArchive errors.

enum class TarEntryType {
    File,
    Directory,
    Other
};

struct TarEntry {
    std::string name;
    TarEntryType type = TarEntryType::File;
    std::uint32_t mode = 0644;
    std::uint64_t size = 0;
    std::int64_t mtime = 0;
};

class TarWriter {
public:
    explicit TarWriter(GzipFileWriter& out);

    core::errors::Result<std::uint64_t> add_directory(const std::string& name,
                                                      std::uint32_t mode,
                                                      std::int64_t mtime);

    // Streams `source` into the archive; fails if the file changes size while
    // it is being copied.
    core::errors::Result<std::uint64_t> add_file(const std::string& name,
                                                 const std::filesystem::path& source,
                                                 std::uint32_t mode, std::int64_t mtime);

    core::errors::Result<std::uint64_t> add_bytes(const std::string& name,
                                                  const std::string& content,
                                                  std::uint32_t mode, std::int64_t mtime);

    // Writes the end-of-archive marker. No entries may be added afterwards.
    core::errors::Result<std::uint64_t> finish();

    std::uint64_t bytes_written() const { return bytes_written_; }

private:
    core::errors::Result<std::uint64_t> write_header(const TarEntry& entry);
    core::errors::Result<std::uint64_t> write_raw(const char* data, std::size_t size);
    core::errors::Result<std::uint64_t> write_padding(std::uint64_t payload_size);

    GzipFileWriter& out_;
    std::uint64_t bytes_written_ = 0;
    bool finished_ = false;
};

class TarReader {
public:
    explicit TarReader(GzipFileReader& in);

    // Advances to the next entry, skipping any unread payload of the current
    // one. Returns std::nullopt at the end-of-archive marker.
    core::errors::Result<std::optional<TarEntry>> next();

    // Copies the current entry's payload to `out`.
    core::errors::Result<std::uint64_t> copy_data(std::ostream& out);

private:
    core::errors::Result<bool> read_block(char* block);
    core::errors::Result<std::uint64_t> read_exact(char* data, std::size_t size);
    core::errors::Result<std::uint64_t> skip_remaining();
    core::errors::Result<std::string> read_payload(std::uint64_t size);

    GzipFileReader& in_;
    std::uint64_t remaining_ = 0;
    std::uint64_t padding_ = 0;
};

}  // namespace runvault::codec

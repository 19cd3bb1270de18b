#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <zlib.h>
#include "core/errors/store_errors.hpp"

namespace runvault::codec {

// In-memory gzip (RFC 1952) framing around zlib deflate.
core::errors::Result<std::string> gzip_compress(const std::string& data);

// Accepts gzip or zlib framed input. Corrupt or truncated input is an
// InvalidArchive error with code "gzip_corrupt".
core::errors::Result<std::string> gzip_decompress(const std::string& data);

// Streaming gzip writer over a file. Owns the gzFile handle.
class GzipFileWriter {
public:
    GzipFileWriter() = default;
    ~GzipFileWriter();
    GzipFileWriter(const GzipFileWriter&) = delete;
    GzipFileWriter& operator=(const GzipFileWriter&) = delete;

    core::errors::Result<std::filesystem::path> open(const std::filesystem::path& path);
    core::errors::Result<std::size_t> write(const char* data, std::size_t size);
    // Flushes the gzip trailer; the file is complete only once close() succeeds.
    core::errors::Result<std::filesystem::path> close();

private:
    gzFile file_ = nullptr;
    std::filesystem::path path_;
};

// Streaming gzip reader. Rejects files that are not gzip framed.
class GzipFileReader {
public:
    GzipFileReader() = default;
    ~GzipFileReader();
    GzipFileReader(const GzipFileReader&) = delete;
    GzipFileReader& operator=(const GzipFileReader&) = delete;

    core::errors::Result<std::filesystem::path> open(const std::filesystem::path& path);
    // Returns the number of bytes read; 0 means end of stream.
    core::errors::Result<std::size_t> read(char* data, std::size_t size);

private:
    gzFile file_ = nullptr;
    std::filesystem::path path_;
};

}  // namespace runvault::codec

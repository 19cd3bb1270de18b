#include "codec/gzip.hpp"

#include <algorithm>
#include <climits>
#include <cstring>
#include <string>

namespace runvault::codec {

using core::errors::ErrorCategory;
using core::errors::StoreError;

namespace {

constexpr int kGzipWindowBits = 15 + 16;
constexpr int kAutoDetectWindowBits = 15 + 32;
constexpr std::size_t kChunkSize = 64 * 1024;

std::string zlib_message(const z_stream& stream, const int code) {
    if (stream.msg != nullptr) {
        return stream.msg;
    }
    return "zlib error " + std::to_string(code);
}

std::string gz_message(gzFile file) {
    int code = Z_OK;
    const char* message = gzerror(file, &code);
    return message != nullptr ? message : "unknown gzip error";
}

}  // namespace

core::errors::Result<std::string> gzip_compress(const std::string& data) {
    if (data.size() > UINT_MAX) {
        return StoreError{ErrorCategory::Input, "Payload too large for in-memory gzip",
                          "gzip_payload_too_large"};
    }
    z_stream stream;
    std::memset(&stream, 0, sizeof(stream));
    int rc = deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, kGzipWindowBits, 8,
                          Z_DEFAULT_STRATEGY);
    if (rc != Z_OK) {
        return StoreError{ErrorCategory::Io, "Unable to initialise gzip encoder: " +
                                                 zlib_message(stream, rc),
                          "gzip_init_failed"};
    }

    std::string out;
    out.reserve(deflateBound(&stream, static_cast<uLong>(data.size())));
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    stream.avail_in = static_cast<uInt>(data.size());

    char buffer[kChunkSize];
    do {
        stream.next_out = reinterpret_cast<Bytef*>(buffer);
        stream.avail_out = static_cast<uInt>(sizeof(buffer));
        rc = deflate(&stream, Z_FINISH);
        if (rc == Z_STREAM_ERROR) {
            deflateEnd(&stream);
            return StoreError{ErrorCategory::Io,
                              "gzip encoding failed: " + zlib_message(stream, rc),
                              "gzip_encode_failed"};
        }
        out.append(buffer, sizeof(buffer) - stream.avail_out);
    } while (rc != Z_STREAM_END);

    deflateEnd(&stream);
    return out;
}

core::errors::Result<std::string> gzip_decompress(const std::string& data) {
    if (data.size() > UINT_MAX) {
        return StoreError{ErrorCategory::Input, "Payload too large for in-memory gzip",
                          "gzip_payload_too_large"};
    }
    z_stream stream;
    std::memset(&stream, 0, sizeof(stream));
    int rc = inflateInit2(&stream, kAutoDetectWindowBits);
    if (rc != Z_OK) {
        return StoreError{ErrorCategory::Io, "Unable to initialise gzip decoder: " +
                                                 zlib_message(stream, rc),
                          "gzip_init_failed"};
    }

    std::string out;
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    stream.avail_in = static_cast<uInt>(data.size());

    char buffer[kChunkSize];
    do {
        stream.next_out = reinterpret_cast<Bytef*>(buffer);
        stream.avail_out = static_cast<uInt>(sizeof(buffer));
        rc = inflate(&stream, Z_NO_FLUSH);
        if (rc == Z_NEED_DICT || rc == Z_DATA_ERROR || rc == Z_MEM_ERROR ||
            rc == Z_STREAM_ERROR) {
            const std::string message = zlib_message(stream, rc);
            inflateEnd(&stream);
            return StoreError{ErrorCategory::InvalidArchive,
                              "Corrupt gzip stream: " + message, "gzip_corrupt"};
        }
        out.append(buffer, sizeof(buffer) - stream.avail_out);
        if (rc == Z_BUF_ERROR && stream.avail_in == 0) {
            inflateEnd(&stream);
            return StoreError{ErrorCategory::InvalidArchive, "Truncated gzip stream",
                              "gzip_corrupt"};
        }
    } while (rc != Z_STREAM_END);

    inflateEnd(&stream);
    return out;
}

GzipFileWriter::~GzipFileWriter() {
    if (file_ != nullptr) {
        static_cast<void>(gzclose(file_));
    }
}

core::errors::Result<std::filesystem::path> GzipFileWriter::open(
    const std::filesystem::path& path) {
    if (file_ != nullptr) {
        return StoreError{ErrorCategory::Internal, "gzip writer is already open",
                          "gzip_already_open"};
    }
    file_ = gzopen(path.c_str(), "wb");
    if (file_ == nullptr) {
        return StoreError{ErrorCategory::Io, "Unable to open gzip output: " + path.string(),
                          "gzip_open_failed"};
    }
    path_ = path;
    return path_;
}

core::errors::Result<std::size_t> GzipFileWriter::write(const char* data,
                                                        const std::size_t size) {
    if (file_ == nullptr) {
        return StoreError{ErrorCategory::Internal, "gzip writer is not open",
                          "gzip_not_open"};
    }
    std::size_t written = 0;
    while (written < size) {
        const std::size_t chunk = std::min<std::size_t>(size - written, INT_MAX);
        const int n = gzwrite(file_, data + written, static_cast<unsigned>(chunk));
        if (n <= 0) {
            return StoreError{ErrorCategory::Io,
                              "gzip write failed for " + path_.string() + ": " +
                                  gz_message(file_),
                              "gzip_write_failed"};
        }
        written += static_cast<std::size_t>(n);
    }
    return written;
}

core::errors::Result<std::filesystem::path> GzipFileWriter::close() {
    if (file_ == nullptr) {
        return StoreError{ErrorCategory::Internal, "gzip writer is not open",
                          "gzip_not_open"};
    }
    const int rc = gzclose(file_);
    file_ = nullptr;
    if (rc != Z_OK) {
        return StoreError{ErrorCategory::Io,
                          "gzip close failed for " + path_.string() + " (code " +
                              std::to_string(rc) + ")",
                          "gzip_close_failed"};
    }
    return path_;
}

GzipFileReader::~GzipFileReader() {
    if (file_ != nullptr) {
        static_cast<void>(gzclose(file_));
    }
}

core::errors::Result<std::filesystem::path> GzipFileReader::open(
    const std::filesystem::path& path) {
    if (file_ != nullptr) {
        return StoreError{ErrorCategory::Internal, "gzip reader is already open",
                          "gzip_already_open"};
    }
    file_ = gzopen(path.c_str(), "rb");
    if (file_ == nullptr) {
        return StoreError{ErrorCategory::Io, "Unable to open gzip input: " + path.string(),
                          "gzip_open_failed"};
    }
    path_ = path;
    // gzdirect() peeks at the header; a non-gzip file would otherwise be
    // passed through verbatim.
    if (gzdirect(file_) == 1) {
        static_cast<void>(gzclose(file_));
        file_ = nullptr;
        return StoreError{ErrorCategory::InvalidArchive,
                          "File is not gzip compressed: " + path.string(), "gzip_corrupt"};
    }
    return path_;
}

core::errors::Result<std::size_t> GzipFileReader::read(char* data, const std::size_t size) {
    if (file_ == nullptr) {
        return StoreError{ErrorCategory::Internal, "gzip reader is not open",
                          "gzip_not_open"};
    }
    const std::size_t chunk = std::min<std::size_t>(size, INT_MAX);
    const int n = gzread(file_, data, static_cast<unsigned>(chunk));
    if (n < 0) {
        return StoreError{ErrorCategory::InvalidArchive,
                          "Corrupt gzip stream in " + path_.string() + ": " + gz_message(file_),
                          "gzip_corrupt"};
    }
    if (n == 0) {
        int code = Z_OK;
        gzerror(file_, &code);
        if (code != Z_OK && code != Z_STREAM_END) {
            return StoreError{ErrorCategory::InvalidArchive,
                              "Corrupt gzip stream in " + path_.string() + ": " +
                                  gz_message(file_),
                              "gzip_corrupt"};
        }
    }
    return static_cast<std::size_t>(n);
}

}  // namespace runvault::codec

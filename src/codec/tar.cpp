#include "codec/tar.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <system_error>

namespace runvault::codec {

using core::errors::ErrorCategory;
using core::errors::StoreError;

namespace {

constexpr std::size_t kBlockSize = 512;
constexpr std::size_t kNameSize = 100;
constexpr std::size_t kPrefixSize = 155;
constexpr std::uint64_t kMaxMetaPayload = 1024 * 1024;
constexpr std::size_t kCopyChunk = 64 * 1024;

constexpr std::size_t kModeOffset = 100;
constexpr std::size_t kUidOffset = 108;
constexpr std::size_t kGidOffset = 116;
constexpr std::size_t kSizeOffset = 124;
constexpr std::size_t kMtimeOffset = 136;
constexpr std::size_t kChecksumOffset = 148;
constexpr std::size_t kTypeOffset = 156;
constexpr std::size_t kMagicOffset = 257;
constexpr std::size_t kVersionOffset = 263;
constexpr std::size_t kPrefixOffset = 345;

constexpr char kTypeFile = '0';
constexpr char kTypeFileOld = '\0';
constexpr char kTypeContiguous = '7';
constexpr char kTypeDirectory = '5';
constexpr char kTypeGnuLongName = 'L';
constexpr char kTypePaxHeader = 'x';
constexpr char kTypePaxGlobal = 'g';

using Block = std::array<char, kBlockSize>;

std::uint64_t padding_for(const std::uint64_t size) {
    const std::uint64_t rem = size % kBlockSize;
    return rem == 0 ? 0 : kBlockSize - rem;
}

bool write_octal(char* field, const std::size_t width, const std::uint64_t value) {
    const std::size_t digits = width - 1;
    if (digits < 22 && value >= (static_cast<std::uint64_t>(1) << (3 * digits))) {
        return false;
    }
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%0*llo", static_cast<int>(digits),
                  static_cast<unsigned long long>(value));
    std::memcpy(field, buffer, digits);
    field[digits] = '\0';
    return true;
}

bool parse_number(const char* field, const std::size_t width, std::uint64_t& out) {
    const auto lead = static_cast<unsigned char>(field[0]);
    if ((lead & 0x80U) != 0U) {
        // GNU base-256 encoding; negative values are not meaningful here.
        if ((lead & 0x40U) != 0U) {
            return false;
        }
        std::uint64_t value = lead & 0x3FU;
        for (std::size_t i = 1; i < width; ++i) {
            if (value > (UINT64_MAX >> 8)) {
                return false;
            }
            value = (value << 8) | static_cast<unsigned char>(field[i]);
        }
        out = value;
        return true;
    }

    std::uint64_t value = 0;
    std::size_t i = 0;
    while (i < width && field[i] == ' ') {
        ++i;
    }
    for (; i < width; ++i) {
        const char c = field[i];
        if (c == '\0' || c == ' ') {
            break;
        }
        if (c < '0' || c > '7') {
            return false;
        }
        value = (value << 3) | static_cast<std::uint64_t>(c - '0');
    }
    out = value;
    return true;
}

std::uint64_t unsigned_checksum(const Block& block) {
    std::uint64_t sum = 0;
    for (std::size_t i = 0; i < kBlockSize; ++i) {
        if (i >= kChecksumOffset && i < kChecksumOffset + 8) {
            sum += static_cast<unsigned char>(' ');
        } else {
            sum += static_cast<unsigned char>(block[i]);
        }
    }
    return sum;
}

std::int64_t signed_checksum(const Block& block) {
    std::int64_t sum = 0;
    for (std::size_t i = 0; i < kBlockSize; ++i) {
        if (i >= kChecksumOffset && i < kChecksumOffset + 8) {
            sum += ' ';
        } else {
            sum += static_cast<signed char>(block[i]);
        }
    }
    return sum;
}

std::string field_string(const char* field, const std::size_t width) {
    const char* end = static_cast<const char*>(std::memchr(field, '\0', width));
    return std::string(field, end == nullptr ? width : static_cast<std::size_t>(end - field));
}

// Splits a long name across the ustar prefix and name fields at a '/'.
bool split_ustar_name(const std::string& name, std::string& prefix, std::string& base) {
    if (name.size() <= kNameSize) {
        prefix.clear();
        base = name;
        return true;
    }
    const std::size_t limit = std::min(name.size() - 1, kPrefixSize);
    for (std::size_t i = limit; i > 0; --i) {
        if (name[i] != '/') {
            continue;
        }
        const std::size_t base_len = name.size() - i - 1;
        if (base_len == 0 || base_len > kNameSize) {
            break;
        }
        prefix = name.substr(0, i);
        base = name.substr(i + 1);
        return true;
    }
    return false;
}

StoreError truncated_archive() {
    return StoreError{ErrorCategory::InvalidArchive, "Unexpected end of tar stream",
                      "tar_truncated"};
}

std::string parse_pax_path(const std::string& payload) {
    std::string path;
    std::size_t pos = 0;
    while (pos < payload.size()) {
        const std::size_t space = payload.find(' ', pos);
        if (space == std::string::npos) {
            break;
        }
        std::size_t length = 0;
        for (std::size_t i = pos; i < space; ++i) {
            if (payload[i] < '0' || payload[i] > '9') {
                return path;
            }
            length = length * 10 + static_cast<std::size_t>(payload[i] - '0');
        }
        if (length == 0 || pos + length > payload.size()) {
            break;
        }
        // Record layout: "<len> <key>=<value>\n"
        const std::string record = payload.substr(space + 1, pos + length - space - 2);
        const std::size_t eq = record.find('=');
        if (eq != std::string::npos && record.substr(0, eq) == "path") {
            path = record.substr(eq + 1);
        }
        pos += length;
    }
    return path;
}

}  // namespace

TarWriter::TarWriter(GzipFileWriter& out) : out_(out) {}

core::errors::Result<std::uint64_t> TarWriter::write_raw(const char* data,
                                                         const std::size_t size) {
    auto written = out_.write(data, size);
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }
    bytes_written_ += core::errors::get_value(written);
    return bytes_written_;
}

core::errors::Result<std::uint64_t> TarWriter::write_padding(const std::uint64_t payload_size) {
    const std::uint64_t padding = padding_for(payload_size);
    if (padding == 0) {
        return bytes_written_;
    }
    const Block zeros{};
    return write_raw(zeros.data(), static_cast<std::size_t>(padding));
}

core::errors::Result<std::uint64_t> TarWriter::write_header(const TarEntry& entry) {
    if (finished_) {
        return StoreError{ErrorCategory::Internal, "tar archive already finished",
                          "tar_finished"};
    }

    std::string prefix;
    std::string base;
    if (!split_ustar_name(entry.name, prefix, base)) {
        TarEntry long_name;
        long_name.name = "././@LongLink";
        long_name.size = entry.name.size() + 1;

        Block block{};
        std::memcpy(block.data(), long_name.name.data(), long_name.name.size());
        write_octal(block.data() + kModeOffset, 8, 0644);
        write_octal(block.data() + kUidOffset, 8, 0);
        write_octal(block.data() + kGidOffset, 8, 0);
        write_octal(block.data() + kSizeOffset, 12, long_name.size);
        write_octal(block.data() + kMtimeOffset, 12, 0);
        block[kTypeOffset] = kTypeGnuLongName;
        std::memcpy(block.data() + kMagicOffset, "ustar ", 6);
        std::memcpy(block.data() + kVersionOffset, " \0", 2);
        std::snprintf(block.data() + kChecksumOffset, 8, "%06llo",
                      static_cast<unsigned long long>(unsigned_checksum(block)));
        block[kChecksumOffset + 7] = ' ';

        auto header = write_raw(block.data(), block.size());
        if (core::errors::is_error(header)) {
            return header;
        }
        auto payload = write_raw(entry.name.c_str(), entry.name.size() + 1);
        if (core::errors::is_error(payload)) {
            return payload;
        }
        auto padded = write_padding(long_name.size);
        if (core::errors::is_error(padded)) {
            return padded;
        }
        prefix.clear();
        base = entry.name.substr(0, kNameSize);
    }

    Block block{};
    std::memcpy(block.data(), base.data(), std::min(base.size(), kNameSize));
    if (!write_octal(block.data() + kModeOffset, 8, entry.mode & 07777U) ||
        !write_octal(block.data() + kUidOffset, 8, 0) ||
        !write_octal(block.data() + kGidOffset, 8, 0) ||
        !write_octal(block.data() + kSizeOffset, 12, entry.size) ||
        !write_octal(block.data() + kMtimeOffset, 12,
                     static_cast<std::uint64_t>(std::max<std::int64_t>(entry.mtime, 0)))) {
        return StoreError{ErrorCategory::Io, "tar header field overflow for " + entry.name,
                          "tar_entry_too_large"};
    }
    block[kTypeOffset] = entry.type == TarEntryType::Directory ? kTypeDirectory : kTypeFile;
    std::memcpy(block.data() + kMagicOffset, "ustar", 6);
    std::memcpy(block.data() + kVersionOffset, "00", 2);
    std::memcpy(block.data() + kPrefixOffset, prefix.data(), std::min(prefix.size(), kPrefixSize));
    std::snprintf(block.data() + kChecksumOffset, 8, "%06llo",
                  static_cast<unsigned long long>(unsigned_checksum(block)));
    block[kChecksumOffset + 7] = ' ';

    return write_raw(block.data(), block.size());
}

core::errors::Result<std::uint64_t> TarWriter::add_directory(const std::string& name,
                                                             const std::uint32_t mode,
                                                             const std::int64_t mtime) {
    TarEntry entry;
    entry.name = name;
    if (entry.name.empty() || entry.name.back() != '/') {
        entry.name.push_back('/');
    }
    entry.type = TarEntryType::Directory;
    entry.mode = mode;
    entry.mtime = mtime;
    entry.size = 0;
    return write_header(entry);
}

core::errors::Result<std::uint64_t> TarWriter::add_file(const std::string& name,
                                                        const std::filesystem::path& source,
                                                        const std::uint32_t mode,
                                                        const std::int64_t mtime) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(source, ec);
    if (ec) {
        return StoreError{ErrorCategory::Io,
                          "Unable to stat file for archive: " + source.string(),
                          "tar_source_unreadable"};
    }
    std::ifstream in(source, std::ios::binary);
    if (!in.is_open()) {
        return StoreError{ErrorCategory::Io,
                          "Unable to open file for archive: " + source.string(),
                          "tar_source_unreadable"};
    }

    TarEntry entry;
    entry.name = name;
    entry.type = TarEntryType::File;
    entry.mode = mode;
    entry.mtime = mtime;
    entry.size = size;
    auto header = write_header(entry);
    if (core::errors::is_error(header)) {
        return header;
    }

    std::array<char, kCopyChunk> buffer{};
    std::uint64_t copied = 0;
    while (copied < size) {
        const auto want =
            static_cast<std::streamsize>(std::min<std::uint64_t>(buffer.size(), size - copied));
        in.read(buffer.data(), want);
        const std::streamsize got = in.gcount();
        if (got <= 0) {
            break;
        }
        auto written = write_raw(buffer.data(), static_cast<std::size_t>(got));
        if (core::errors::is_error(written)) {
            return written;
        }
        copied += static_cast<std::uint64_t>(got);
    }
    if (copied != size) {
        return StoreError{ErrorCategory::Io,
                          "File changed size while archiving: " + source.string(),
                          "tar_source_changed"};
    }
    return write_padding(size);
}

core::errors::Result<std::uint64_t> TarWriter::add_bytes(const std::string& name,
                                                         const std::string& content,
                                                         const std::uint32_t mode,
                                                         const std::int64_t mtime) {
    TarEntry entry;
    entry.name = name;
    entry.type = TarEntryType::File;
    entry.mode = mode;
    entry.mtime = mtime;
    entry.size = content.size();
    auto header = write_header(entry);
    if (core::errors::is_error(header)) {
        return header;
    }
    auto payload = write_raw(content.data(), content.size());
    if (core::errors::is_error(payload)) {
        return payload;
    }
    return write_padding(content.size());
}

core::errors::Result<std::uint64_t> TarWriter::finish() {
    if (finished_) {
        return bytes_written_;
    }
    const Block zeros{};
    for (int i = 0; i < 2; ++i) {
        auto written = write_raw(zeros.data(), zeros.size());
        if (core::errors::is_error(written)) {
            return written;
        }
    }
    finished_ = true;
    return bytes_written_;
}

TarReader::TarReader(GzipFileReader& in) : in_(in) {}

core::errors::Result<std::uint64_t> TarReader::read_exact(char* data, const std::size_t size) {
    std::size_t total = 0;
    while (total < size) {
        auto n = in_.read(data + total, size - total);
        if (core::errors::is_error(n)) {
            return core::errors::get_error(n);
        }
        if (core::errors::get_value(n) == 0) {
            break;
        }
        total += core::errors::get_value(n);
    }
    return static_cast<std::uint64_t>(total);
}

core::errors::Result<bool> TarReader::read_block(char* block) {
    auto n = read_exact(block, kBlockSize);
    if (core::errors::is_error(n)) {
        return core::errors::get_error(n);
    }
    const auto got = core::errors::get_value(n);
    if (got == 0) {
        return false;
    }
    if (got < kBlockSize) {
        return truncated_archive();
    }
    return true;
}

core::errors::Result<std::uint64_t> TarReader::skip_remaining() {
    std::uint64_t left = remaining_ + padding_;
    std::array<char, kCopyChunk> buffer{};
    while (left > 0) {
        const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), left));
        auto n = read_exact(buffer.data(), want);
        if (core::errors::is_error(n)) {
            return n;
        }
        if (core::errors::get_value(n) < want) {
            return truncated_archive();
        }
        left -= want;
    }
    const std::uint64_t skipped = remaining_ + padding_;
    remaining_ = 0;
    padding_ = 0;
    return skipped;
}

core::errors::Result<std::string> TarReader::read_payload(const std::uint64_t size) {
    if (size > kMaxMetaPayload) {
        return StoreError{ErrorCategory::InvalidArchive, "tar metadata record too large",
                          "tar_bad_header"};
    }
    std::string payload(static_cast<std::size_t>(size), '\0');
    auto n = read_exact(payload.data(), payload.size());
    if (core::errors::is_error(n)) {
        return core::errors::get_error(n);
    }
    if (core::errors::get_value(n) < size) {
        return truncated_archive();
    }
    remaining_ = 0;
    padding_ = padding_for(size);
    auto skipped = skip_remaining();
    if (core::errors::is_error(skipped)) {
        return core::errors::get_error(skipped);
    }
    return payload;
}

core::errors::Result<std::optional<TarEntry>> TarReader::next() {
    auto skipped = skip_remaining();
    if (core::errors::is_error(skipped)) {
        return core::errors::get_error(skipped);
    }

    std::string long_name;
    std::string pax_path;
    while (true) {
        Block block{};
        auto read = read_block(block.data());
        if (core::errors::is_error(read)) {
            return core::errors::get_error(read);
        }
        if (!core::errors::get_value(read)) {
            return std::optional<TarEntry>{};
        }
        if (std::all_of(block.begin(), block.end(), [](const char c) { return c == '\0'; })) {
            return std::optional<TarEntry>{};
        }

        std::uint64_t stored_checksum = 0;
        if (!parse_number(block.data() + kChecksumOffset, 8, stored_checksum) ||
            (stored_checksum != unsigned_checksum(block) &&
             static_cast<std::int64_t>(stored_checksum) != signed_checksum(block))) {
            return StoreError{ErrorCategory::InvalidArchive, "tar header checksum mismatch",
                              "tar_checksum_mismatch"};
        }

        std::uint64_t size = 0;
        std::uint64_t mode = 0;
        std::uint64_t mtime = 0;
        if (!parse_number(block.data() + kSizeOffset, 12, size) ||
            !parse_number(block.data() + kModeOffset, 8, mode) ||
            !parse_number(block.data() + kMtimeOffset, 12, mtime)) {
            return StoreError{ErrorCategory::InvalidArchive, "malformed tar header field",
                              "tar_bad_header"};
        }

        const char type = block[kTypeOffset];
        if (type == kTypeGnuLongName) {
            auto payload = read_payload(size);
            if (core::errors::is_error(payload)) {
                return core::errors::get_error(payload);
            }
            long_name = field_string(core::errors::get_value(payload).data(),
                                     core::errors::get_value(payload).size());
            continue;
        }
        if (type == kTypePaxHeader || type == kTypePaxGlobal) {
            auto payload = read_payload(size);
            if (core::errors::is_error(payload)) {
                return core::errors::get_error(payload);
            }
            if (type == kTypePaxHeader) {
                pax_path = parse_pax_path(core::errors::get_value(payload));
            }
            continue;
        }

        TarEntry entry;
        if (!pax_path.empty()) {
            entry.name = pax_path;
        } else if (!long_name.empty()) {
            entry.name = long_name;
        } else {
            const std::string base = field_string(block.data(), kNameSize);
            const bool is_ustar = std::memcmp(block.data() + kMagicOffset, "ustar", 5) == 0;
            const std::string prefix =
                is_ustar ? field_string(block.data() + kPrefixOffset, kPrefixSize) : "";
            entry.name = prefix.empty() ? base : prefix + "/" + base;
        }
        entry.size = size;
        entry.mode = static_cast<std::uint32_t>(mode & 07777U);
        entry.mtime = static_cast<std::int64_t>(mtime);

        const bool trailing_slash = !entry.name.empty() && entry.name.back() == '/';
        if (type == kTypeDirectory || ((type == kTypeFile || type == kTypeFileOld) && trailing_slash)) {
            entry.type = TarEntryType::Directory;
        } else if (type == kTypeFile || type == kTypeFileOld || type == kTypeContiguous) {
            entry.type = TarEntryType::File;
        } else {
            entry.type = TarEntryType::Other;
        }
        while (entry.name.size() > 1 && entry.name.back() == '/') {
            entry.name.pop_back();
        }

        remaining_ = size;
        padding_ = padding_for(size);
        return std::optional<TarEntry>{entry};
    }
}

core::errors::Result<std::uint64_t> TarReader::copy_data(std::ostream& out) {
    std::array<char, kCopyChunk> buffer{};
    std::uint64_t copied = 0;
    while (remaining_ > 0) {
        const auto want =
            static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), remaining_));
        auto n = read_exact(buffer.data(), want);
        if (core::errors::is_error(n)) {
            return n;
        }
        if (core::errors::get_value(n) < want) {
            return truncated_archive();
        }
        out.write(buffer.data(), static_cast<std::streamsize>(want));
        if (!out.good()) {
            return StoreError{ErrorCategory::Io, "Unable to write extracted tar payload",
                              "tar_extract_write_failed"};
        }
        remaining_ -= want;
        copied += want;
    }
    return copied;
}

}  // namespace runvault::codec

#include "topojar/zip_archive.hpp"
#include "topojar/path_utils.hpp"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <system_error>

#include <spdlog/spdlog.h>
#include <zlib.h>

namespace fs = std::filesystem;

namespace topojar {

// ============================================================================
// Zip Format Constants
// ============================================================================

static constexpr uint32_t LOCAL_HEADER_SIGNATURE = 0x04034b50;
static constexpr uint32_t CENTRAL_HEADER_SIGNATURE = 0x02014b50;
static constexpr uint32_t END_RECORD_SIGNATURE = 0x06054b50;
static constexpr uint32_t ZIP64_END_RECORD_SIGNATURE = 0x06064b50;
static constexpr uint32_t ZIP64_LOCATOR_SIGNATURE = 0x07064b50;

static constexpr size_t LOCAL_HEADER_SIZE = 30;
static constexpr size_t CENTRAL_HEADER_SIZE = 46;
static constexpr size_t END_RECORD_SIZE = 22;
static constexpr size_t ZIP64_END_RECORD_SIZE = 56;
static constexpr size_t ZIP64_LOCATOR_SIZE = 20;
static constexpr size_t MAX_COMMENT_SIZE = 0xFFFF;

static constexpr uint16_t FLAG_ENCRYPTED = 0x0001;
static constexpr uint16_t HOST_UNIX = 3;
static constexpr uint16_t ZIP64_EXTRA_TAG = 0x0001;
static constexpr uint32_t ZIP32_SENTINEL = 0xFFFFFFFF;

// ============================================================================
// Helper Functions
// ============================================================================

static uint16_t read_u16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

static uint32_t read_u32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

static uint64_t read_u64(const uint8_t* p) {
    return static_cast<uint64_t>(read_u32(p)) | (static_cast<uint64_t>(read_u32(p + 4)) << 32);
}

namespace {

struct EndRecord {
    bool ok = false;
    std::string error;
    uint64_t entry_count = 0;
    uint64_t directory_size = 0;
    uint64_t directory_offset = 0;
};

bool read_at(std::istream& in, uint64_t offset, uint8_t* out, size_t size) {
    in.clear();
    in.seekg(static_cast<std::streamoff>(offset));
    in.read(reinterpret_cast<char*>(out), static_cast<std::streamsize>(size));
    return static_cast<bool>(in);
}

// Replace the end record's fields with those of the zip64 end record that
// precedes it, if there is one. Returns the zip64 record offset, which
// bounds the central directory, or record_pos when there is none.
uint64_t read_zip64_end_record(std::istream& in, uint64_t record_pos, EndRecord& record) {
    uint8_t locator[ZIP64_LOCATOR_SIZE];
    if (record_pos < ZIP64_LOCATOR_SIZE ||
        !read_at(in, record_pos - ZIP64_LOCATOR_SIZE, locator, sizeof(locator)) ||
        read_u32(locator) != ZIP64_LOCATOR_SIGNATURE) {
        return record_pos;
    }

    if (read_u32(locator + 4) != 0 || read_u32(locator + 16) > 1) {
        record.error = "multi-disk zip archives are not supported";
        return record_pos;
    }

    uint64_t zip64_pos = read_u64(locator + 8);
    uint8_t end[ZIP64_END_RECORD_SIZE];
    if (zip64_pos + ZIP64_END_RECORD_SIZE > record_pos - ZIP64_LOCATOR_SIZE ||
        !read_at(in, zip64_pos, end, sizeof(end)) ||
        read_u32(end) != ZIP64_END_RECORD_SIGNATURE) {
        record.error = "corrupt zip64 end of central directory";
        return record_pos;
    }
    if (read_u32(end + 16) != 0 || read_u32(end + 20) != 0) {
        record.error = "multi-disk zip archives are not supported";
        return record_pos;
    }

    record.entry_count = read_u64(end + 32);
    record.directory_size = read_u64(end + 40);
    record.directory_offset = read_u64(end + 48);
    return zip64_pos;
}

// Scan the archive tail backwards for the end-of-central-directory record
EndRecord locate_end_record(std::istream& in) {
    EndRecord record;

    in.seekg(0, std::ios::end);
    std::streamoff file_size = in.tellg();
    if (file_size < static_cast<std::streamoff>(END_RECORD_SIZE)) {
        record.error = "file too small to be a zip archive";
        return record;
    }

    std::streamoff tail_size = std::min<std::streamoff>(
        file_size, static_cast<std::streamoff>(END_RECORD_SIZE + MAX_COMMENT_SIZE));
    std::vector<uint8_t> tail(static_cast<size_t>(tail_size));
    uint64_t tail_start = static_cast<uint64_t>(file_size - tail_size);

    if (!read_at(in, tail_start, tail.data(), tail.size())) {
        record.error = "failed to read zip end record";
        return record;
    }

    for (size_t pos = tail.size() - END_RECORD_SIZE + 1; pos-- > 0;) {
        const uint8_t* p = tail.data() + pos;
        if (read_u32(p) != END_RECORD_SIGNATURE) {
            continue;
        }

        uint16_t comment_len = read_u16(p + 20);
        if (pos + END_RECORD_SIZE + comment_len > tail.size()) {
            continue;
        }

        uint16_t disk = read_u16(p + 4);
        uint16_t directory_disk = read_u16(p + 6);
        if (disk != 0 || directory_disk != 0) {
            record.error = "multi-disk zip archives are not supported";
            return record;
        }

        record.entry_count = read_u16(p + 10);
        record.directory_size = read_u32(p + 12);
        record.directory_offset = read_u32(p + 16);

        uint64_t record_pos = tail_start + pos;
        uint64_t directory_limit = record_pos;
        if (record.entry_count == 0xFFFF ||
            record.directory_size == ZIP32_SENTINEL ||
            record.directory_offset == ZIP32_SENTINEL) {
            directory_limit = read_zip64_end_record(in, record_pos, record);
            if (!record.error.empty()) {
                return record;
            }
        }

        if (record.directory_size > directory_limit ||
            record.directory_offset > directory_limit - record.directory_size) {
            record.error = "zip central directory lies outside the file";
            return record;
        }

        record.ok = true;
        return record;
    }

    record.error = "zip end of central directory not found";
    return record;
}

// Fill sentinel sizes and offset from a zip64 extended information field
bool apply_zip64_extra(const uint8_t* extra, size_t extra_len, ZipEntry& entry,
                       std::string& error) {
    size_t pos = 0;
    while (pos + 4 <= extra_len) {
        uint16_t tag = read_u16(extra + pos);
        uint16_t size = read_u16(extra + pos + 2);
        const uint8_t* data = extra + pos + 4;
        if (pos + 4 + size > extra_len) {
            break;
        }
        pos += 4 + size;
        if (tag != ZIP64_EXTRA_TAG) {
            continue;
        }

        size_t field = 0;
        auto next = [&](uint64_t& value) {
            if (field + 8 > size) {
                return false;
            }
            value = read_u64(data + field);
            field += 8;
            return true;
        };

        uint64_t uncompressed = entry.uncompressed_size;
        uint64_t compressed = entry.compressed_size;
        if ((entry.uncompressed_size == ZIP32_SENTINEL && !next(uncompressed)) ||
            (entry.compressed_size == ZIP32_SENTINEL && !next(compressed)) ||
            (entry.local_header_offset == ZIP32_SENTINEL && !next(entry.local_header_offset))) {
            error = "corrupt zip64 extra field: " + entry.name;
            return false;
        }
        if (uncompressed > ZIP32_SENTINEL || compressed > ZIP32_SENTINEL) {
            error = "zip entries larger than 4 GiB are not supported: " + entry.name;
            return false;
        }
        entry.uncompressed_size = static_cast<uint32_t>(uncompressed);
        entry.compressed_size = static_cast<uint32_t>(compressed);
        return true;
    }

    error = "missing zip64 extra field: " + entry.name;
    return false;
}

std::vector<uint8_t> inflate_raw(const std::vector<uint8_t>& compressed, size_t expected_size,
                                 std::string& error) {
    std::vector<uint8_t> result(expected_size);
    if (expected_size == 0) {
        return result;
    }

    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));

    // Raw deflate (negative window bits)
    if (inflateInit2(&strm, -15) != Z_OK) {
        error = "inflateInit2 failed";
        return {};
    }

    strm.next_in = const_cast<Bytef*>(compressed.data());
    strm.avail_in = static_cast<uInt>(compressed.size());
    strm.next_out = result.data();
    strm.avail_out = static_cast<uInt>(result.size());

    int ret = inflate(&strm, Z_FINISH);
    uLong produced = strm.total_out;
    inflateEnd(&strm);

    if (ret != Z_STREAM_END || produced != expected_size) {
        error = "inflate failed";
        return {};
    }

    return result;
}

} // namespace

// ============================================================================
// ZipEntry
// ============================================================================

bool ZipEntry::is_directory() const {
    return !name.empty() && name.back() == '/';
}

uint32_t ZipEntry::unix_mode() const {
    if ((version_made_by >> 8) != HOST_UNIX) {
        return 0;
    }
    return external_attributes >> 16;
}

// ============================================================================
// Public API Implementation
// ============================================================================

bool is_zip_file(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return false;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return false;
    }
    return locate_end_record(in).ok;
}

ZipReader::~ZipReader() {
    close();
}

void ZipReader::close() {
    if (file_.is_open()) {
        file_.close();
        spdlog::debug("closed archive {}", path_);
    }
}

ZipResult ZipReader::open(const std::string& path) {
    ZipResult result;

    close();
    entries_.clear();
    path_ = path;

    file_.open(path, std::ios::binary);
    if (!file_) {
        result.error = "failed to open archive: " + path;
        return result;
    }

    EndRecord end = locate_end_record(file_);
    if (!end.ok) {
        file_.close();
        result.error = end.error;
        return result;
    }

    std::vector<uint8_t> directory(static_cast<size_t>(end.directory_size));
    if (!read_at(file_, end.directory_offset, directory.data(), directory.size())) {
        file_.close();
        result.error = "failed to read zip central directory";
        return result;
    }

    size_t pos = 0;
    for (uint64_t i = 0; i < end.entry_count; ++i) {
        if (pos + CENTRAL_HEADER_SIZE > directory.size() ||
            read_u32(directory.data() + pos) != CENTRAL_HEADER_SIGNATURE) {
            file_.close();
            entries_.clear();
            result.error = "corrupt zip central directory";
            return result;
        }

        const uint8_t* p = directory.data() + pos;

        ZipEntry entry;
        entry.version_made_by = read_u16(p + 4);
        entry.flags = read_u16(p + 8);
        entry.method = read_u16(p + 10);
        entry.dos_time = read_u16(p + 12);
        entry.dos_date = read_u16(p + 14);
        entry.crc32 = read_u32(p + 16);
        entry.compressed_size = read_u32(p + 20);
        entry.uncompressed_size = read_u32(p + 24);
        uint16_t name_len = read_u16(p + 28);
        uint16_t extra_len = read_u16(p + 30);
        uint16_t comment_len = read_u16(p + 32);
        entry.external_attributes = read_u32(p + 38);
        entry.local_header_offset = read_u32(p + 42);

        size_t record_size = CENTRAL_HEADER_SIZE + name_len + extra_len + comment_len;
        if (pos + record_size > directory.size()) {
            file_.close();
            entries_.clear();
            result.error = "corrupt zip central directory";
            return result;
        }

        entry.name.assign(reinterpret_cast<const char*>(p + CENTRAL_HEADER_SIZE), name_len);

        if (entry.compressed_size == ZIP32_SENTINEL ||
            entry.uncompressed_size == ZIP32_SENTINEL ||
            entry.local_header_offset == ZIP32_SENTINEL) {
            std::string error;
            if (!apply_zip64_extra(p + CENTRAL_HEADER_SIZE + name_len, extra_len, entry, error)) {
                file_.close();
                entries_.clear();
                result.error = error;
                return result;
            }
        }

        entries_.push_back(std::move(entry));
        pos += record_size;
    }

    spdlog::debug("opened archive {} ({} entries)", path, entries_.size());

    result.ok = true;
    return result;
}

const ZipEntry* ZipReader::find(const std::string& name) const {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&name](const ZipEntry& e) { return e.name == name; });
    return it == entries_.end() ? nullptr : &*it;
}

ZipReadResult ZipReader::read(const ZipEntry& entry) {
    ZipReadResult result;

    if (!file_.is_open()) {
        result.error = "archive is not open";
        return result;
    }
    if (entry.flags & FLAG_ENCRYPTED) {
        result.error = "encrypted zip entries are not supported: " + entry.name;
        return result;
    }
    if (entry.method != ZIP_METHOD_STORE && entry.method != ZIP_METHOD_DEFLATE) {
        result.error = "unsupported compression method " + std::to_string(entry.method) +
                       ": " + entry.name;
        return result;
    }

    uint8_t header[LOCAL_HEADER_SIZE];
    if (!read_at(file_, entry.local_header_offset, header, LOCAL_HEADER_SIZE) ||
        read_u32(header) != LOCAL_HEADER_SIGNATURE) {
        result.error = "corrupt zip local header: " + entry.name;
        return result;
    }

    // Sizes come from the central directory; local ones may be zero when a
    // data descriptor follows the payload.
    uint16_t name_len = read_u16(header + 26);
    uint16_t extra_len = read_u16(header + 28);
    uint64_t data_offset = static_cast<uint64_t>(entry.local_header_offset) +
                           LOCAL_HEADER_SIZE + name_len + extra_len;

    std::vector<uint8_t> raw(entry.compressed_size);
    file_.seekg(static_cast<std::streamoff>(data_offset));
    file_.read(reinterpret_cast<char*>(raw.data()), entry.compressed_size);
    if (!file_) {
        result.error = "truncated zip entry: " + entry.name;
        return result;
    }

    if (entry.method == ZIP_METHOD_STORE) {
        result.data = std::move(raw);
    } else {
        std::string error;
        result.data = inflate_raw(raw, entry.uncompressed_size, error);
        if (!error.empty()) {
            result.error = error + ": " + entry.name;
            return result;
        }
    }

    uint32_t crc = static_cast<uint32_t>(
        crc32(0, result.data.data(), static_cast<uInt>(result.data.size())));
    if (crc != entry.crc32) {
        result.data.clear();
        result.error = "CRC mismatch: " + entry.name;
        return result;
    }

    result.ok = true;
    return result;
}

ZipExtractResult ZipReader::extract_all(const std::string& dest) {
    ZipExtractResult result;

    for (const auto& entry : entries_) {
        PathResult target = resolve_entry_path(dest, entry.name);
        if (!target.ok) {
            result.error = std::string(path_error_to_string(target.error)) + ": " + entry.name;
            return result;
        }

        std::error_code ec;
        if (entry.is_directory()) {
            fs::create_directories(target.path, ec);
            if (ec) {
                result.error = "failed to create directory " + target.path + ": " + ec.message();
                return result;
            }
            result.entries.push_back(entry.name);
            continue;
        }

        fs::create_directories(fs::path(target.path).parent_path(), ec);
        if (ec) {
            result.error = "failed to create directory for " + entry.name + ": " + ec.message();
            return result;
        }

        ZipReadResult data = read(entry);
        if (!data.ok) {
            result.error = data.error;
            return result;
        }

        std::ofstream out(target.path, std::ios::binary | std::ios::trunc);
        if (!out) {
            result.error = "failed to create file: " + target.path;
            return result;
        }
        out.write(reinterpret_cast<const char*>(data.data.data()),
                  static_cast<std::streamsize>(data.data.size()));
        if (!out) {
            result.error = "failed to write file: " + target.path;
            return result;
        }

        result.entries.push_back(entry.name);
    }

    spdlog::debug("extracted {} entries from {} to {}", result.entries.size(), path_, dest);

    result.ok = true;
    return result;
}

} // namespace topojar

#include "topojar/zip_archive.hpp"

#include <cerrno>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iterator>

#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <zlib.h>

namespace topojar {

// ============================================================================
// Zip Format Constants
// ============================================================================

static constexpr uint32_t LOCAL_HEADER_SIGNATURE = 0x04034b50;
static constexpr uint32_t CENTRAL_HEADER_SIGNATURE = 0x02014b50;
static constexpr uint32_t END_RECORD_SIGNATURE = 0x06054b50;
static constexpr uint32_t ZIP64_END_RECORD_SIGNATURE = 0x06064b50;
static constexpr uint32_t ZIP64_LOCATOR_SIGNATURE = 0x07064b50;

static constexpr uint16_t ZIP_VERSION = 20;                         // 2.0
static constexpr uint16_t ZIP64_VERSION = 45;                       // 4.5
static constexpr uint16_t VERSION_MADE_BY_UNIX = (3 << 8) | ZIP_VERSION;
static constexpr uint16_t FLAG_UTF8 = 0x0800;
static constexpr uint16_t ZIP64_EXTRA_TAG = 0x0001;
static constexpr uint32_t MSDOS_DIRECTORY_ATTR = 0x10;
static constexpr uint32_t ZIP32_LIMIT = 0xFFFFFFFF;
static constexpr uint16_t ZIP32_MAX_ENTRIES = 0xFFFF;

// ============================================================================
// Helper Functions
// ============================================================================

static void write_u16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xff));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xff));
}

static void write_u32(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xff));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xff));
    out.push_back(static_cast<uint8_t>((value >> 16) & 0xff));
    out.push_back(static_cast<uint8_t>((value >> 24) & 0xff));
}

static void write_u64(std::vector<uint8_t>& out, uint64_t value) {
    write_u32(out, static_cast<uint32_t>(value & 0xFFFFFFFF));
    write_u32(out, static_cast<uint32_t>(value >> 32));
}

namespace {

// MS-DOS date/time in local time; DOS dates start in 1980
void to_dos_time(std::time_t t, uint16_t& dos_time, uint16_t& dos_date) {
    std::tm tm_buf;
    localtime_r(&t, &tm_buf);

    if (tm_buf.tm_year < 80) {
        dos_time = 0;
        dos_date = (1 << 5) | 1;    // 1980-01-01
        return;
    }

    dos_time = static_cast<uint16_t>((tm_buf.tm_hour << 11) |
                                     (tm_buf.tm_min << 5) |
                                     (tm_buf.tm_sec / 2));
    dos_date = static_cast<uint16_t>(((tm_buf.tm_year - 80) << 9) |
                                     ((tm_buf.tm_mon + 1) << 5) |
                                     tm_buf.tm_mday);
}

bool needs_utf8_flag(const std::string& name) {
    for (unsigned char c : name) {
        if (c >= 0x80) return true;
    }
    return false;
}

std::vector<uint8_t> deflate_raw(const std::vector<uint8_t>& data, std::string& error) {
    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));

    if (deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -15, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        error = "deflateInit2 failed";
        return {};
    }

    std::vector<uint8_t> compressed(deflateBound(&strm, data.size()));

    strm.next_in = const_cast<Bytef*>(data.data());
    strm.avail_in = static_cast<uInt>(data.size());
    strm.next_out = compressed.data();
    strm.avail_out = static_cast<uInt>(compressed.size());

    int ret = deflate(&strm, Z_FINISH);
    uLong produced = strm.total_out;
    deflateEnd(&strm);

    if (ret != Z_STREAM_END) {
        error = "deflate failed";
        return {};
    }

    compressed.resize(produced);
    return compressed;
}

} // namespace

// ============================================================================
// ZipWriter
// ============================================================================

ZipWriter::~ZipWriter() {
    if (is_open()) {
        ZipResult closed = close();
        if (!closed.ok) {
            spdlog::warn("failed to finalize archive {}: {}", path_, closed.error);
        }
    }
}

ZipResult ZipWriter::create(const std::string& path) {
    ZipResult result;

    if (is_open()) {
        result.error = "archive already open: " + path_;
        return result;
    }

    // "x": fail instead of truncating an existing file
    file_ = std::fopen(path.c_str(), "wbx");
    if (file_ == nullptr) {
        result.error = "failed to create archive " + path + ": " + std::strerror(errno);
        return result;
    }

    path_ = path;
    offset_ = 0;
    entries_.clear();

    result.ok = true;
    return result;
}

bool ZipWriter::write_bytes(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) {
        return true;
    }
    if (std::fwrite(bytes.data(), 1, bytes.size(), file_) != bytes.size()) {
        return false;
    }
    offset_ += bytes.size();
    return true;
}

ZipResult ZipWriter::write_entry(ZipEntry entry, const std::vector<uint8_t>& payload) {
    ZipResult result;

    if (!is_open()) {
        result.error = "archive is not open";
        return result;
    }
    if (entry.name.empty() || entry.name.size() > 0xFFFF) {
        result.error = "invalid zip entry name: " + entry.name;
        return result;
    }

    entry.local_header_offset = offset_;
    entry.version_made_by = VERSION_MADE_BY_UNIX;
    if (needs_utf8_flag(entry.name)) {
        entry.flags |= FLAG_UTF8;
    }

    std::vector<uint8_t> header;
    header.reserve(30 + entry.name.size());
    write_u32(header, LOCAL_HEADER_SIGNATURE);
    write_u16(header, ZIP_VERSION);
    write_u16(header, entry.flags);
    write_u16(header, entry.method);
    write_u16(header, entry.dos_time);
    write_u16(header, entry.dos_date);
    write_u32(header, entry.crc32);
    write_u32(header, entry.compressed_size);
    write_u32(header, entry.uncompressed_size);
    write_u16(header, static_cast<uint16_t>(entry.name.size()));
    write_u16(header, 0);   // extra field length
    header.insert(header.end(), entry.name.begin(), entry.name.end());

    if (!write_bytes(header) || !write_bytes(payload)) {
        result.error = "failed to write zip entry " + entry.name + ": " + std::strerror(errno);
        return result;
    }

    entries_.push_back(std::move(entry));
    result.ok = true;
    return result;
}

ZipResult ZipWriter::add_file(const std::string& source_path, const std::string& entry_name) {
    ZipResult result;

    struct stat st;
    if (::stat(source_path.c_str(), &st) != 0) {
        result.error = "failed to stat " + source_path + ": " + std::strerror(errno);
        return result;
    }

    std::ifstream in(source_path, std::ios::binary);
    if (!in) {
        result.error = "failed to open file: " + source_path;
        return result;
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)),
                              std::istreambuf_iterator<char>());
    if (in.bad()) {
        result.error = "failed to read file: " + source_path;
        return result;
    }
    if (data.size() >= ZIP32_LIMIT) {
        result.error = "file too large for a zip entry: " + source_path;
        return result;
    }

    std::string error;
    std::vector<uint8_t> compressed = deflate_raw(data, error);
    if (!error.empty()) {
        result.error = error + ": " + source_path;
        return result;
    }
    if (compressed.size() >= ZIP32_LIMIT) {
        result.error = "file too large for a zip entry: " + source_path;
        return result;
    }

    ZipEntry entry;
    entry.name = entry_name;
    entry.method = ZIP_METHOD_DEFLATE;
    to_dos_time(st.st_mtime, entry.dos_time, entry.dos_date);
    entry.crc32 = static_cast<uint32_t>(crc32(0, data.data(), static_cast<uInt>(data.size())));
    entry.compressed_size = static_cast<uint32_t>(compressed.size());
    entry.uncompressed_size = static_cast<uint32_t>(data.size());
    entry.external_attributes = (static_cast<uint32_t>(st.st_mode) & 0xFFFF) << 16;

    return write_entry(std::move(entry), compressed);
}

ZipResult ZipWriter::add_directory(const std::string& entry_name) {
    ZipEntry entry;
    entry.name = entry_name;
    if (entry.name.empty() || entry.name.back() != '/') {
        entry.name += '/';
    }
    entry.method = ZIP_METHOD_STORE;
    to_dos_time(std::time(nullptr), entry.dos_time, entry.dos_date);
    entry.external_attributes = ((040755u & 0xFFFF) << 16) | MSDOS_DIRECTORY_ATTR;

    return write_entry(std::move(entry), {});
}

ZipResult ZipWriter::close() {
    ZipResult result;

    if (!is_open()) {
        result.ok = true;
        return result;
    }

    std::FILE* file = file_;
    uint64_t directory_offset = offset_;

    std::vector<uint8_t> directory;
    for (const auto& entry : entries_) {
        // Offsets past 4 GiB move into a zip64 extra field
        bool zip64_offset = entry.local_header_offset >= ZIP32_LIMIT;

        write_u32(directory, CENTRAL_HEADER_SIGNATURE);
        write_u16(directory, entry.version_made_by);
        write_u16(directory, zip64_offset ? ZIP64_VERSION : ZIP_VERSION);
        write_u16(directory, entry.flags);
        write_u16(directory, entry.method);
        write_u16(directory, entry.dos_time);
        write_u16(directory, entry.dos_date);
        write_u32(directory, entry.crc32);
        write_u32(directory, entry.compressed_size);
        write_u32(directory, entry.uncompressed_size);
        write_u16(directory, static_cast<uint16_t>(entry.name.size()));
        write_u16(directory, zip64_offset ? 12 : 0);    // extra field length
        write_u16(directory, 0);    // file comment length
        write_u16(directory, 0);    // disk number start
        write_u16(directory, 0);    // internal file attributes
        write_u32(directory, entry.external_attributes);
        write_u32(directory, zip64_offset ? ZIP32_LIMIT
                                          : static_cast<uint32_t>(entry.local_header_offset));
        directory.insert(directory.end(), entry.name.begin(), entry.name.end());

        if (zip64_offset) {
            write_u16(directory, ZIP64_EXTRA_TAG);
            write_u16(directory, 8);
            write_u64(directory, entry.local_header_offset);
        }
    }

    uint64_t entry_count = entries_.size();
    uint64_t directory_size = directory.size();
    bool zip64 = entry_count >= ZIP32_MAX_ENTRIES ||
                 directory_size >= ZIP32_LIMIT ||
                 directory_offset >= ZIP32_LIMIT;

    std::vector<uint8_t> end;
    if (zip64) {
        uint64_t zip64_end_offset = directory_offset + directory_size;

        write_u32(end, ZIP64_END_RECORD_SIGNATURE);
        write_u64(end, 44);     // size of the rest of this record
        write_u16(end, static_cast<uint16_t>((3 << 8) | ZIP64_VERSION));
        write_u16(end, ZIP64_VERSION);
        write_u32(end, 0);      // number of this disk
        write_u32(end, 0);      // disk with the central directory
        write_u64(end, entry_count);
        write_u64(end, entry_count);
        write_u64(end, directory_size);
        write_u64(end, directory_offset);

        write_u32(end, ZIP64_LOCATOR_SIGNATURE);
        write_u32(end, 0);      // disk with the zip64 end record
        write_u64(end, zip64_end_offset);
        write_u32(end, 1);      // total number of disks
    }

    uint16_t count16 = entry_count >= ZIP32_MAX_ENTRIES ? ZIP32_MAX_ENTRIES
                                                         : static_cast<uint16_t>(entry_count);
    write_u32(end, END_RECORD_SIGNATURE);
    write_u16(end, 0);      // number of this disk
    write_u16(end, 0);      // disk with the central directory
    write_u16(end, count16);
    write_u16(end, count16);
    write_u32(end, directory_size >= ZIP32_LIMIT ? ZIP32_LIMIT
                                                 : static_cast<uint32_t>(directory_size));
    write_u32(end, directory_offset >= ZIP32_LIMIT ? ZIP32_LIMIT
                                                   : static_cast<uint32_t>(directory_offset));
    write_u16(end, 0);      // comment length

    bool ok = write_bytes(directory) && write_bytes(end);
    if (!ok) {
        result.error = "failed to write zip central directory: " + path_;
    }

    file_ = nullptr;
    if (std::fclose(file) != 0 && ok) {
        ok = false;
        result.error = "failed to close archive " + path_ + ": " + std::strerror(errno);
    }

    if (ok) {
        spdlog::debug("wrote archive {} ({} entries{})", path_, entries_.size(),
                      zip64 ? ", zip64" : "");
    }

    result.ok = ok;
    return result;
}

} // namespace topojar

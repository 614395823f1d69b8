#pragma once

#include <cstdint>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

namespace topojar {

// ============================================================================
// Zip Archive Codec
// ============================================================================
//
// Minimal zip reader/writer for jar files:
//   - Read: stored (0) and deflate (8) entries, CRC-32 verified
//   - Write: deflate only, no data descriptors, unix mode in external attrs
//   - Zip64 end records and local header offsets once an archive outgrows
//     65535 entries or 4 GiB; a single entry is still limited to 4 GiB
//   - No encryption, no multi-disk archives

constexpr uint16_t ZIP_METHOD_STORE = 0;
constexpr uint16_t ZIP_METHOD_DEFLATE = 8;

struct ZipEntry {
    std::string name;                   // Archive path, '/' separated
    uint16_t version_made_by = 0;
    uint16_t flags = 0;
    uint16_t method = ZIP_METHOD_STORE;
    uint16_t dos_time = 0;
    uint16_t dos_date = 0;
    uint32_t crc32 = 0;
    uint32_t compressed_size = 0;
    uint32_t uncompressed_size = 0;
    uint32_t external_attributes = 0;
    uint64_t local_header_offset = 0;

    bool is_directory() const;

    // Unix st_mode stored by unix writers, 0 when absent
    uint32_t unix_mode() const;
};

struct ZipResult {
    bool ok = false;
    std::string error;
};

struct ZipReadResult {
    bool ok = false;
    std::string error;
    std::vector<uint8_t> data;
};

struct ZipExtractResult {
    bool ok = false;
    std::string error;
    std::vector<std::string> entries;   // Paths written, relative to the destination
};

// True if the file exists and ends with a parseable end-of-central-directory record.
bool is_zip_file(const std::string& path);

class ZipReader {
public:
    ZipReader() = default;
    ~ZipReader();

    ZipReader(const ZipReader&) = delete;
    ZipReader& operator=(const ZipReader&) = delete;

    // Open an archive and load its central directory
    ZipResult open(const std::string& path);

    // Release the file handle. Safe to call more than once.
    void close();

    bool is_open() const { return file_.is_open(); }
    const std::string& path() const { return path_; }
    const std::vector<ZipEntry>& entries() const { return entries_; }

    const ZipEntry* find(const std::string& name) const;

    // Read and decompress one entry
    ZipReadResult read(const ZipEntry& entry);

    // Extract every entry under dest, keeping archive paths
    ZipExtractResult extract_all(const std::string& dest);

private:
    std::ifstream file_;
    std::string path_;
    std::vector<ZipEntry> entries_;
};

class ZipWriter {
public:
    ZipWriter() = default;
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    // Create a new archive. Fails if anything already exists at path.
    ZipResult create(const std::string& path);

    // Add a file from disk (symlinks are followed), deflate-compressed
    ZipResult add_file(const std::string& source_path, const std::string& entry_name);

    // Add an explicit directory entry ("name/")
    ZipResult add_directory(const std::string& entry_name);

    // Write the central directory and close the file. Safe to call more than once.
    ZipResult close();

    bool is_open() const { return file_ != nullptr; }
    size_t entry_count() const { return entries_.size(); }

private:
    ZipResult write_entry(ZipEntry entry, const std::vector<uint8_t>& payload);
    bool write_bytes(const std::vector<uint8_t>& bytes);

    std::FILE* file_ = nullptr;
    std::string path_;
    uint64_t offset_ = 0;
    std::vector<ZipEntry> entries_;
};

} // namespace topojar

#pragma once

#include "topojar/errors.hpp"

#include <string>
#include <vector>

namespace topojar {

// ============================================================================
// Jar Packing
// ============================================================================

// A file to archive and its entry name relative to the workspace root
struct PackEntry {
    std::string source_path;
    std::string entry_name;
};

// Walk workspace and list every file to archive, sorted by entry name.
// The workspace directory itself never appears in entry names. Directories
// are not listed; symlinks resolving to regular files are, other links are
// skipped. Throws std::filesystem::filesystem_error.
std::vector<PackEntry> collect_pack_entries(const std::string& workspace);

struct PackResult {
    Status status;
    size_t entry_count = 0;
};

// Build output_jar from the content of workspace.
// Fails with JarError if output_jar already exists; nothing is ever appended
// to or overwritten. The archive file is always closed. Write failures after
// creation throw std::runtime_error and may leave a partial file behind.
PackResult pack_jar(const std::string& workspace, const std::string& output_jar);

} // namespace topojar

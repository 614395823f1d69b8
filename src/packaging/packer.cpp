#include "topojar/packer.hpp"
#include "topojar/platform.hpp"
#include "topojar/zip_archive.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <system_error>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace topojar {

std::vector<PackEntry> collect_pack_entries(const std::string& workspace) {
    std::vector<PackEntry> entries;
    fs::path base_path(workspace);

    // Directory symlinks are not followed
    for (const auto& entry : fs::recursive_directory_iterator(workspace)) {
        std::error_code ec;
        if (entry.is_symlink()) {
            // Links are archived with their target's content
            if (!fs::is_regular_file(entry.path(), ec)) {
                spdlog::debug("skipping link {}", entry.path().string());
                continue;
            }
        } else if (!entry.is_regular_file()) {
            continue;
        }

        std::string rel = to_portable_path(entry.path().lexically_relative(base_path).string());
        entries.push_back({entry.path().string(), rel});
    }

    std::sort(entries.begin(), entries.end(),
              [](const PackEntry& a, const PackEntry& b) { return a.entry_name < b.entry_name; });
    return entries;
}

PackResult pack_jar(const std::string& workspace, const std::string& output_jar) {
    PackResult result;

    std::error_code ec;
    if (fs::exists(fs::symlink_status(output_jar, ec))) {
        result.status = Status::failure(ErrorKind::JarError,
                                        "Output jar already exists: " + output_jar);
        return result;
    }

    // The writer's destructor closes the file if the walk throws
    ZipWriter writer;
    ZipResult created = writer.create(output_jar);
    if (!created.ok) {
        if (fs::exists(fs::symlink_status(output_jar, ec))) {
            result.status = Status::failure(ErrorKind::JarError,
                                            "Output jar already exists: " + output_jar);
            return result;
        }
        throw std::runtime_error(created.error);
    }

    for (const auto& entry : collect_pack_entries(workspace)) {
        ZipResult added = writer.add_file(entry.source_path, entry.entry_name);
        if (!added.ok) {
            throw std::runtime_error(added.error);
        }
    }

    result.entry_count = writer.entry_count();

    ZipResult closed = writer.close();
    if (!closed.ok) {
        throw std::runtime_error(closed.error);
    }

    spdlog::debug("packed {} entries into {}", result.entry_count, output_jar);
    return result;
}

} // namespace topojar

#include "topojar/stager.hpp"
#include "topojar/path_utils.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace topojar {

std::string resources_dir(const std::string& workspace, const Layout& layout) {
    PathResult resolved = resolve_entry_path(workspace, layout.resources_path);
    if (!resolved.ok) {
        throw std::runtime_error("invalid resources path '" + layout.resources_path +
                                 "': " + path_error_to_string(resolved.error));
    }
    return resolved.path;
}

std::vector<std::string> select_topology_content(const std::string& topology_dir,
                                                 bool exclude_requirements,
                                                 const Layout& layout) {
    std::vector<std::string> content;

    for (const auto& entry : fs::directory_iterator(topology_dir)) {
        std::string name = entry.path().filename().string();

        // Same as a shell "*" glob
        if (name.empty() || name[0] == '.') {
            continue;
        }
        if (name == layout.yaml_filename) {
            continue;
        }
        if (exclude_requirements && name == layout.requirements_filename) {
            continue;
        }

        content.push_back(entry.path().string());
    }

    std::sort(content.begin(), content.end());
    return content;
}

void copy_file_with_metadata(const std::string& src, const std::string& dst) {
    fs::copy_file(src, dst, fs::copy_options::overwrite_existing);
    fs::permissions(dst, fs::status(src).permissions(), fs::perm_options::replace);
    fs::last_write_time(dst, fs::last_write_time(src));
}

void copy_tree(const std::string& src, const std::string& dst) {
    fs::create_directories(dst);

    for (const auto& entry : fs::directory_iterator(src)) {
        fs::path target = fs::path(dst) / entry.path().filename();

        if (entry.is_symlink()) {
            fs::file_status existing = fs::symlink_status(target);
            if (fs::exists(existing) && !fs::is_directory(existing)) {
                fs::remove(target);
            }
            fs::copy_symlink(entry.path(), target);
        } else if (entry.is_directory()) {
            copy_tree(entry.path().string(), target.string());
        } else {
            copy_file_with_metadata(entry.path().string(), target.string());
        }
    }

    // Directory permissions are left writable so the workspace can be removed
    fs::last_write_time(dst, fs::last_write_time(src));
}

void copy_dir_content(const std::string& topology_dir,
                      const std::string& dst,
                      bool exclude_requirements,
                      const Layout& layout) {
    for (const auto& item : select_topology_content(topology_dir, exclude_requirements, layout)) {
        fs::path target = fs::path(dst) / fs::path(item).filename();

        // is_directory follows links: a top-level link to a directory is
        // copied as a directory.
        if (fs::is_directory(item)) {
            copy_tree(item, target.string());
        } else {
            copy_file_with_metadata(item, target.string());
        }
        spdlog::debug("copied {}", fs::path(item).filename().string());
    }
}

void stage_workspace(ZipReader& base_jar,
                     const std::string& workspace,
                     const TopologyPaths& paths,
                     const RunOptions& options,
                     const Layout& layout) {
    ZipExtractResult extracted = base_jar.extract_all(workspace);
    if (!extracted.ok) {
        throw std::runtime_error("failed to extract base jar: " + extracted.error);
    }

    std::string resources = resources_dir(workspace, layout);
    fs::create_directories(resources);

    copy_file_with_metadata(paths.yaml, (fs::path(resources) / layout.yaml_filename).string());

    copy_dir_content(paths.topology_dir, resources,
                     /*exclude_requirements=*/options.use_env != UseEnv::Enabled, layout);
}

} // namespace topojar

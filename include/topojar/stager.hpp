#pragma once

#include "topojar/layout.hpp"
#include "topojar/options.hpp"
#include "topojar/zip_archive.hpp"

#include <string>
#include <vector>

namespace topojar {

// ============================================================================
// Workspace Staging
// ============================================================================

// Top-level entries of the topology directory to copy into resources/.
// Excluded: the YAML always, requirements.txt unless exclude_requirements
// is false, and dot-entries. Only the top level is filtered; nested files
// with the same names are copied. Returned sorted.
std::vector<std::string> select_topology_content(const std::string& topology_dir,
                                                 bool exclude_requirements,
                                                 const Layout& layout = default_layout());

// Copy a directory tree. Symlinks are recreated as links, regular files
// keep timestamps and permissions, existing directories are merged and
// existing files replaced. Throws std::filesystem::filesystem_error.
void copy_tree(const std::string& src, const std::string& dst);

// Copy a single file with its timestamps and permissions (follows symlinks).
void copy_file_with_metadata(const std::string& src, const std::string& dst);

// Copy the content of topology_dir (not the directory itself) into dst.
void copy_dir_content(const std::string& topology_dir,
                      const std::string& dst,
                      bool exclude_requirements,
                      const Layout& layout = default_layout());

// Populate the workspace:
//   1. extract the base jar into workspace
//   2. copy the topology YAML into workspace/resources/
//   3. copy the rest of the topology directory into workspace/resources/
//
// Filesystem failures throw std::filesystem::filesystem_error and archive
// failures std::runtime_error; neither is a domain error.
void stage_workspace(ZipReader& base_jar,
                     const std::string& workspace,
                     const TopologyPaths& paths,
                     const RunOptions& options,
                     const Layout& layout = default_layout());

// workspace/resources as a filesystem path
std::string resources_dir(const std::string& workspace, const Layout& layout = default_layout());

} // namespace topojar

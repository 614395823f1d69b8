#pragma once

#include <string>

namespace topojar {

enum class PathError {
    None,
    Empty,
    ContainsNul,
    AbsoluteNotAllowed,
    EscapesRoot,
};

const char* path_error_to_string(PathError error);

struct PathResult {
    bool ok = false;
    std::string path;       // root joined with the normalized entry when ok
    PathError error = PathError::None;
};

// Map an archive entry name onto a directory without touching the filesystem.
// - Rejects empty names and NUL bytes
// - Rejects absolute names ("/x", "C:/x")
// - Collapses "." and ".." segments; fails if the result would leave root
// A trailing '/' (directory entry) is dropped from the result.
PathResult resolve_entry_path(const std::string& root, const std::string& entry_name);

} // namespace topojar

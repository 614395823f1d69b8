#include "topojar/path_utils.hpp"

#include <filesystem>
#include <sstream>
#include <vector>

namespace topojar {

namespace {

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream ss(s);
    while (std::getline(ss, current, delim)) {
        parts.push_back(current);
    }
    return parts;
}

bool is_absolute_name(const std::string& name) {
    if (name[0] == '/' || name[0] == '\\') {
        return true;
    }
    // Drive letter
    return name.size() >= 2 && name[1] == ':';
}

} // namespace

const char* path_error_to_string(PathError error) {
    switch (error) {
        case PathError::None: return "none";
        case PathError::Empty: return "empty entry name";
        case PathError::ContainsNul: return "entry name contains NUL";
        case PathError::AbsoluteNotAllowed: return "absolute entry name";
        case PathError::EscapesRoot: return "entry escapes extraction root";
    }
    return "unknown";
}

PathResult resolve_entry_path(const std::string& root, const std::string& entry_name) {
    if (entry_name.empty()) {
        return {false, {}, PathError::Empty};
    }
    if (entry_name.find('\0') != std::string::npos) {
        return {false, {}, PathError::ContainsNul};
    }
    if (is_absolute_name(entry_name)) {
        return {false, {}, PathError::AbsoluteNotAllowed};
    }

    std::string portable = entry_name;
    for (auto& c : portable) {
        if (c == '\\') c = '/';
    }

    std::vector<std::string> normalized;
    for (const auto& part : split(portable, '/')) {
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            if (normalized.empty()) {
                return {false, {}, PathError::EscapesRoot};
            }
            normalized.pop_back();
        } else {
            normalized.push_back(part);
        }
    }

    if (normalized.empty()) {
        // "./" or "a/.." - the root itself
        return {true, root, PathError::None};
    }

    std::filesystem::path out(root);
    for (const auto& part : normalized) {
        out /= part;
    }
    return {true, out.lexically_normal().string(), PathError::None};
}

} // namespace topojar

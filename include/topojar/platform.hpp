#pragma once

#include <optional>
#include <string>

namespace topojar {

// ============================================================================
// Environment
// ============================================================================

// Get an environment variable
std::optional<std::string> get_env(const std::string& name);

// Generate a random (version 4) UUID string
std::string generate_uuid();

// ============================================================================
// Path Utilities
// ============================================================================

// Convert a path to use forward slashes (zip entry format)
std::string to_portable_path(const std::string& path);

// Absolute, lexically normalized path without a trailing separator
std::string absolute_path(const std::string& path);

// Last path component, ignoring a trailing separator ("a/myjob/" -> "myjob")
std::string base_name(const std::string& path);

} // namespace topojar

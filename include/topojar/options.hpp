#pragma once

#include "topojar/layout.hpp"

#include <optional>
#include <string>

namespace topojar {

// ============================================================================
// Run Options
// ============================================================================

// Whether dependencies are installed into a virtualenv.
// Unset is resolved exactly once during validation.
enum class UseEnv {
    Unset,
    Enabled,
    Disabled,
};

const char* use_env_to_string(UseEnv value);

struct RunOptions {
    UseEnv use_env = UseEnv::Unset;
    bool system_site_packages = false;      // virtualenv --system-site-packages
    std::optional<std::string> index_url;   // pip -i
    std::optional<std::string> pip_log;     // pip --log (absolute)
    bool verbose = false;
    // Verbose subprocess output goes to stderr (stdout carries --json)
    bool subprocess_output_to_stderr = false;

    std::string base_jar;                   // absolute
    std::string output_jar;                 // absolute
    std::string virtualenv_tool = "virtualenv";

    // Parent of the scratch workspace. Empty means the system temp directory.
    std::string scratch_root;
};

// Flag values as given on the command line, before resolution.
struct OptionInputs {
    std::string topology_dir;
    std::optional<std::string> base_jar;
    std::optional<std::string> output_jar;
    std::optional<bool> use_virtualenv;
    std::optional<std::string> index_url;
    std::optional<std::string> pip_log;
    std::optional<std::string> virtualenv_tool;
    bool system_site_packages = false;
    bool verbose = false;
};

// Result of turning flag values into a RunOptions snapshot
struct ResolvedOptions {
    std::string topology_dir;   // absolute, no trailing separator
    RunOptions options;
};

// Resolve flags into absolute paths and defaults.
// Priority for base jar and virtualenv tool: flag > environment > default.
//   TOPOJAR_BASE_JAR    base jar path
//   TOPOJAR_VIRTUALENV  virtualenv executable
ResolvedOptions resolve_options(const OptionInputs& inputs,
                                const Layout& layout = default_layout());

// Absolute output jar path: explicit override, else <cwd>/<basename>.<ext>
std::string build_output_path(const std::optional<std::string>& output_arg,
                              const std::string& topology_dir,
                              const Layout& layout = default_layout());

} // namespace topojar

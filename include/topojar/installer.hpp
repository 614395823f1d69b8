#pragma once

#include "topojar/errors.hpp"
#include "topojar/layout.hpp"
#include "topojar/options.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace topojar {

// ============================================================================
// Dependency Installation (virtualenv + pip)
// ============================================================================

struct InstallerConfig {
    // Create the virtualenv with access to system-wide site-packages, so pip
    // does not download what is already installed.
    bool system_site_packages = false;
    // Python Package Index URL (pip -i)
    std::optional<std::string> index_url;
    // Verbose log written by pip install (pip --log)
    std::optional<std::string> pip_log;
    // When false, subprocess output goes to /dev/null
    bool verbose = false;
    // With verbose, send subprocess output to stderr instead of stdout
    bool output_to_stderr = false;
    std::string virtualenv_tool = "virtualenv";
};

InstallerConfig installer_config_from(const RunOptions& options);

// Destination of a subprocess's merged stdout and stderr
enum class OutputTarget {
    Discard,    // /dev/null
    Stdout,
    Stderr,
};

// A subprocess invocation. stderr is always merged into stdout.
struct Command {
    std::vector<std::string> argv;
    std::string cwd;
    OutputTarget output = OutputTarget::Discard;

    std::string to_string() const;
};

// <virtualenv_tool> pyleus_venv [--system-site-packages]
Command build_virtualenv_command(const std::string& cwd,
                                 const InstallerConfig& config,
                                 const Layout& layout = default_layout());

// pyleus_venv/bin/pip install -r <requirements> [-i <url>] [--log <path>]
Command build_pip_command(const std::string& cwd,
                          const std::string& requirements,
                          const InstallerConfig& config,
                          const Layout& layout = default_layout());

struct ExecResult {
    bool ok = false;            // Process was started and waited for
    int exit_code = -1;
    std::string error;
};

// Runs a command to completion. Blocks until the child exits.
using CommandRunner = std::function<ExecResult(const Command&)>;

// fork/execvp runner. A program that cannot be executed exits with 127.
ExecResult run_command(const Command& command);

// Create the virtualenv in resources_dir and pip install requirements into it.
// Fails with DependenciesError if either step does not exit 0.
Status install_dependencies(const std::string& resources_dir,
                            const std::string& requirements,
                            const InstallerConfig& config,
                            const CommandRunner& runner = run_command,
                            const Layout& layout = default_layout());

} // namespace topojar

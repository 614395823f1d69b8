#include "topojar/installer.hpp"

#include <filesystem>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace topojar {

InstallerConfig installer_config_from(const RunOptions& options) {
    InstallerConfig config;
    config.system_site_packages = options.system_site_packages;
    config.index_url = options.index_url;
    config.pip_log = options.pip_log;
    config.verbose = options.verbose;
    config.output_to_stderr = options.subprocess_output_to_stderr;
    config.virtualenv_tool = options.virtualenv_tool;
    return config;
}

namespace {

OutputTarget output_target(const InstallerConfig& config) {
    if (!config.verbose) {
        return OutputTarget::Discard;
    }
    return config.output_to_stderr ? OutputTarget::Stderr : OutputTarget::Stdout;
}

} // namespace

Command build_virtualenv_command(const std::string& cwd,
                                 const InstallerConfig& config,
                                 const Layout& layout) {
    Command command;
    command.cwd = cwd;
    command.output = output_target(config);
    command.argv = {config.virtualenv_tool, layout.virtualenv_name};

    if (config.system_site_packages) {
        command.argv.push_back("--system-site-packages");
    }
    return command;
}

Command build_pip_command(const std::string& cwd,
                          const std::string& requirements,
                          const InstallerConfig& config,
                          const Layout& layout) {
    Command command;
    command.cwd = cwd;
    command.output = output_target(config);

    // Relative to cwd, so execvp does not search PATH for it
    std::string pip = (fs::path(layout.virtualenv_name) / "bin" / "pip").string();
    command.argv = {pip, "install", "-r", requirements};

    if (config.index_url) {
        command.argv.push_back("-i");
        command.argv.push_back(*config.index_url);
    }
    if (config.pip_log) {
        command.argv.push_back("--log");
        command.argv.push_back(*config.pip_log);
    }
    return command;
}

namespace {

bool succeeded(const Command& command, const CommandRunner& runner) {
    ExecResult exec = runner(command);
    if (!exec.ok) {
        spdlog::warn("'{}' could not be run: {}", command.to_string(), exec.error);
        return false;
    }
    if (exec.exit_code != 0) {
        spdlog::debug("'{}' exited with {}", command.to_string(), exec.exit_code);
        return false;
    }
    return true;
}

} // namespace

Status install_dependencies(const std::string& resources_dir,
                            const std::string& requirements,
                            const InstallerConfig& config,
                            const CommandRunner& runner,
                            const Layout& layout) {
    if (!succeeded(build_virtualenv_command(resources_dir, config, layout), runner)) {
        return Status::failure(ErrorKind::DependenciesError,
                               "failed to create isolated environment " +
                                   layout.virtualenv_name);
    }

    if (!succeeded(build_pip_command(resources_dir, requirements, config, layout), runner)) {
        return Status::failure(ErrorKind::DependenciesError,
                               "failed to install dependencies from " + requirements +
                                   ", rerun with --verbose for details");
    }

    return Status::success();
}

} // namespace topojar

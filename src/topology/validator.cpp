#include "topojar/validator.hpp"

#include <filesystem>
#include <system_error>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace topojar {

namespace {

Status validate_dir(const std::string& topology_dir) {
    std::error_code ec;
    if (!fs::exists(topology_dir, ec)) {
        return Status::failure(ErrorKind::TopologyError,
                               "Topology directory not found: " + topology_dir);
    }
    if (!fs::is_directory(topology_dir, ec)) {
        return Status::failure(ErrorKind::TopologyError,
                               "Topology directory is not a directory: " + topology_dir);
    }
    return Status::success();
}

Status validate_yaml(const std::string& yaml) {
    std::error_code ec;
    if (!fs::is_regular_file(yaml, ec)) {
        return Status::failure(ErrorKind::InvalidTopologyError,
                               "Topology YAML not found: " + yaml);
    }
    return Status::success();
}

Status validate_requirements(const std::string& requirements, const Layout& layout) {
    std::error_code ec;
    if (!fs::is_regular_file(requirements, ec)) {
        return Status::failure(ErrorKind::InvalidTopologyError,
                               layout.requirements_filename + " file not found");
    }
    return Status::success();
}

// symlink_status: a dangling pyleus_venv link is still a collision
Status validate_virtualenv(const std::string& virtualenv) {
    std::error_code ec;
    if (fs::exists(fs::symlink_status(virtualenv, ec))) {
        return Status::failure(ErrorKind::InvalidTopologyError,
                               "Topology directory must not contain a file named " + virtualenv);
    }
    return Status::success();
}

} // namespace

UseEnv resolve_use_env(UseEnv requested, bool requirements_present) {
    if (requested != UseEnv::Unset) {
        return requested;
    }
    return requirements_present ? UseEnv::Enabled : UseEnv::Disabled;
}

Status validate_topology(const TopologyPaths& paths, RunOptions& options, const Layout& layout) {
    Status status = validate_dir(paths.topology_dir);
    if (!status.ok) return status;

    status = validate_yaml(paths.yaml);
    if (!status.ok) return status;

    std::error_code ec;
    options.use_env = resolve_use_env(options.use_env, fs::is_regular_file(paths.requirements, ec));
    spdlog::debug("virtualenv {}", use_env_to_string(options.use_env));

    if (options.use_env == UseEnv::Enabled) {
        status = validate_requirements(paths.requirements, layout);
        if (!status.ok) return status;

        status = validate_virtualenv(paths.virtualenv);
        if (!status.ok) return status;
    }

    return Status::success();
}

} // namespace topojar

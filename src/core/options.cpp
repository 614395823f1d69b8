#include "topojar/options.hpp"
#include "topojar/platform.hpp"

#include <filesystem>

namespace topojar {

namespace fs = std::filesystem;

const Layout& default_layout() {
    static const Layout layout;
    return layout;
}

TopologyPaths resolve_topology_paths(const std::string& topology_dir, const Layout& layout) {
    fs::path dir(topology_dir);

    TopologyPaths paths;
    paths.topology_dir = topology_dir;
    paths.yaml = (dir / layout.yaml_filename).string();
    paths.requirements = (dir / layout.requirements_filename).string();
    paths.virtualenv = (dir / layout.virtualenv_name).string();
    return paths;
}

const char* use_env_to_string(UseEnv value) {
    switch (value) {
        case UseEnv::Unset: return "unset";
        case UseEnv::Enabled: return "enabled";
        case UseEnv::Disabled: return "disabled";
    }
    return "unknown";
}

std::string build_output_path(const std::optional<std::string>& output_arg,
                              const std::string& topology_dir,
                              const Layout& layout) {
    if (output_arg && !output_arg->empty()) {
        return absolute_path(*output_arg);
    }
    return absolute_path(base_name(absolute_path(topology_dir)) + "." + layout.jar_extension);
}

ResolvedOptions resolve_options(const OptionInputs& inputs, const Layout& layout) {
    ResolvedOptions resolved;
    resolved.topology_dir = absolute_path(inputs.topology_dir);

    RunOptions& opts = resolved.options;

    // 1. Explicit flag, 2. environment, 3. layout default
    std::string base_jar = layout.default_base_jar;
    if (inputs.base_jar && !inputs.base_jar->empty()) {
        base_jar = *inputs.base_jar;
    } else if (auto env_base = get_env("TOPOJAR_BASE_JAR"); env_base && !env_base->empty()) {
        base_jar = *env_base;
    }
    opts.base_jar = absolute_path(base_jar);

    if (inputs.virtualenv_tool && !inputs.virtualenv_tool->empty()) {
        opts.virtualenv_tool = *inputs.virtualenv_tool;
    } else if (auto env_tool = get_env("TOPOJAR_VIRTUALENV"); env_tool && !env_tool->empty()) {
        opts.virtualenv_tool = *env_tool;
    }

    opts.output_jar = build_output_path(inputs.output_jar, resolved.topology_dir, layout);

    if (inputs.use_virtualenv) {
        opts.use_env = *inputs.use_virtualenv ? UseEnv::Enabled : UseEnv::Disabled;
    }

    opts.system_site_packages = inputs.system_site_packages;
    opts.index_url = inputs.index_url;
    if (inputs.pip_log && !inputs.pip_log->empty()) {
        opts.pip_log = absolute_path(*inputs.pip_log);
    }
    opts.verbose = inputs.verbose;

    return resolved;
}

} // namespace topojar

#pragma once

#include <string>

namespace topojar {

// ============================================================================
// Topology Layout Contract
// ============================================================================
//
// Names shared with the JVM runtime that consumes the produced jar.
// Changing any of them requires a matching change on the runtime side.

struct Layout {
    std::string yaml_filename = "pyleus_topology.yaml";
    std::string requirements_filename = "requirements.txt";
    std::string virtualenv_name = "pyleus_venv";
    std::string resources_path = "resources/";
    std::string default_base_jar = "minimal.jar";
    std::string jar_extension = "jar";
};

// Process-wide layout, initialized once on first use.
const Layout& default_layout();

// Paths of the layout files inside a given topology directory.
struct TopologyPaths {
    std::string topology_dir;
    std::string yaml;
    std::string requirements;
    std::string virtualenv;
};

TopologyPaths resolve_topology_paths(const std::string& topology_dir,
                                     const Layout& layout = default_layout());

} // namespace topojar

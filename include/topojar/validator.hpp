#pragma once

#include "topojar/errors.hpp"
#include "topojar/layout.hpp"
#include "topojar/options.hpp"

#include <string>

namespace topojar {

// ============================================================================
// Topology Validation
// ============================================================================

// Resolve UseEnv::Unset from the presence of the requirements file.
// Enabled/Disabled are returned unchanged.
UseEnv resolve_use_env(UseEnv requested, bool requirements_present);

// Check the topology directory before anything is copied out of it:
//   - it exists and is a directory                      (TopologyError)
//   - the topology YAML is present                      (InvalidTopologyError)
//   - with a virtualenv: requirements.txt is present and
//     no pyleus_venv entry would be overwritten         (InvalidTopologyError)
//
// SIDE EFFECT: options.use_env is resolved to Enabled or Disabled.
// The filesystem is never modified.
Status validate_topology(const TopologyPaths& paths,
                         RunOptions& options,
                         const Layout& layout = default_layout());

} // namespace topojar

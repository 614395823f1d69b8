/**
 * topojar - Topology jar builder
 *
 * Builds a self-contained topology jar from a topology directory:
 * the base jar is extracted into a scratch directory, the topology sources
 * are copied under resources/, dependencies listed in requirements.txt are
 * optionally installed into a virtualenv, and the result is packed into
 * <topology>.jar.
 *
 * ```cpp
 * topojar::OptionInputs inputs;
 * inputs.topology_dir = "word_count";
 * auto resolved = topojar::resolve_options(inputs);
 * auto result = topojar::build_jar(resolved.topology_dir, resolved.options);
 * if (!result.ok) {
 *     std::cerr << topojar::format_error("topojar", result.error) << "\n";
 * }
 * ```
 */

#pragma once

#include "topojar/builder.hpp"
#include "topojar/errors.hpp"
#include "topojar/installer.hpp"
#include "topojar/layout.hpp"
#include "topojar/options.hpp"
#include "topojar/packer.hpp"
#include "topojar/platform.hpp"
#include "topojar/scratch_dir.hpp"
#include "topojar/stager.hpp"
#include "topojar/validator.hpp"
#include "topojar/zip_archive.hpp"

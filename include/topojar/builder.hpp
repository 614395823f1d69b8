#pragma once

#include "topojar/errors.hpp"
#include "topojar/installer.hpp"
#include "topojar/layout.hpp"
#include "topojar/options.hpp"

#include <string>

namespace topojar {

// ============================================================================
// Jar Build Pipeline
// ============================================================================
//
//   Start -> BaseOpened -> WorkspaceCreated -> Validated -> Staged
//         -> DependenciesResolved -> Packed -> Done
//
// Any failure ends in Aborted. Once the workspace exists it is removed on
// every exit path, exceptions included, and the base jar is closed exactly
// once.

enum class BuildStage {
    Start,
    BaseOpened,
    WorkspaceCreated,
    Validated,
    Staged,
    DependenciesResolved,
    Packed,
    Done,
    Aborted,
};

const char* build_stage_to_string(BuildStage stage);

struct BuildResult {
    bool ok = false;
    Error error;

    BuildStage stage = BuildStage::Start;       // Done or Aborted when returned
    BuildStage failed_at = BuildStage::Start;   // Last stage reached before aborting

    UseEnv use_env = UseEnv::Unset;             // As resolved by validation
    std::string workspace;                      // Scratch directory used (already removed)
    std::string output_jar;
    size_t entry_count = 0;
};

// Build options.output_jar from topology_dir and options.base_jar.
// Domain failures are returned in the result; unclassified I/O failures
// propagate as exceptions after the workspace has been removed.
// A relative topology_dir is taken from the current directory.
// options.use_env is resolved in place.
BuildResult build_jar(const std::string& topology_dir,
                      RunOptions& options,
                      const CommandRunner& runner = run_command,
                      const Layout& layout = default_layout());

} // namespace topojar

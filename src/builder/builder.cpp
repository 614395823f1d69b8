#include "topojar/builder.hpp"
#include "topojar/packer.hpp"
#include "topojar/platform.hpp"
#include "topojar/scratch_dir.hpp"
#include "topojar/stager.hpp"
#include "topojar/validator.hpp"
#include "topojar/zip_archive.hpp"

#include <filesystem>
#include <system_error>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace topojar {

const char* build_stage_to_string(BuildStage stage) {
    switch (stage) {
        case BuildStage::Start: return "start";
        case BuildStage::BaseOpened: return "base_opened";
        case BuildStage::WorkspaceCreated: return "workspace_created";
        case BuildStage::Validated: return "validated";
        case BuildStage::Staged: return "staged";
        case BuildStage::DependenciesResolved: return "dependencies_resolved";
        case BuildStage::Packed: return "packed";
        case BuildStage::Done: return "done";
        case BuildStage::Aborted: return "aborted";
    }
    return "unknown";
}

namespace {

bool output_exists(const std::string& output_jar) {
    std::error_code ec;
    return fs::exists(fs::symlink_status(output_jar, ec));
}

Status open_base_jar(const std::string& base_jar, ZipReader& reader) {
    std::error_code ec;
    if (!fs::exists(base_jar, ec)) {
        return Status::failure(ErrorKind::JarError, "Base jar not found: " + base_jar);
    }
    if (!is_zip_file(base_jar)) {
        return Status::failure(ErrorKind::JarError, "Base jar is not a jar file: " + base_jar);
    }

    ZipResult opened = reader.open(base_jar);
    if (!opened.ok) {
        return Status::failure(ErrorKind::JarError,
                               "Base jar is not a jar file: " + base_jar + " (" + opened.error + ")");
    }
    return Status::success();
}

void advance(BuildResult& result, BuildStage next) {
    result.stage = next;
    spdlog::debug("build stage: {}", build_stage_to_string(next));
}

BuildResult& abort_build(BuildResult& result, const Status& status) {
    result.ok = false;
    result.error = status.error;
    result.failed_at = result.stage;
    result.stage = BuildStage::Aborted;
    spdlog::debug("build aborted after {}: {}", build_stage_to_string(result.failed_at),
                  status.error.to_string());
    return result;
}

} // namespace

BuildResult build_jar(const std::string& topology_dir,
                      RunOptions& options,
                      const CommandRunner& runner,
                      const Layout& layout) {
    BuildResult result;
    result.output_jar = options.output_jar;

    // Fail fast before touching anything
    if (output_exists(options.output_jar)) {
        return abort_build(result, Status::failure(ErrorKind::JarError,
                                                   "Output jar already exists: " + options.output_jar));
    }

    // Declared first so it is closed last
    ZipReader base_jar;
    Status status = open_base_jar(options.base_jar, base_jar);
    if (!status.ok) {
        return abort_build(result, status);
    }
    advance(result, BuildStage::BaseOpened);

    // Everything is staged in a scratch directory removed on every exit path
    ScratchDir scratch(options.scratch_root);
    result.workspace = scratch.path();
    advance(result, BuildStage::WorkspaceCreated);

    try {
        // pip runs inside resources/, so the requirements path must not be relative
        TopologyPaths paths = resolve_topology_paths(absolute_path(topology_dir), layout);

        status = validate_topology(paths, options, layout);
        result.use_env = options.use_env;
        if (!status.ok) {
            return abort_build(result, status);
        }
        advance(result, BuildStage::Validated);

        stage_workspace(base_jar, scratch.path(), paths, options, layout);
        advance(result, BuildStage::Staged);

        if (options.use_env == UseEnv::Enabled) {
            status = install_dependencies(resources_dir(scratch.path(), layout),
                                          paths.requirements,
                                          installer_config_from(options),
                                          runner,
                                          layout);
            if (!status.ok) {
                return abort_build(result, status);
            }
        }
        advance(result, BuildStage::DependenciesResolved);

        PackResult packed = pack_jar(scratch.path(), options.output_jar);
        if (!packed.status.ok) {
            return abort_build(result, packed.status);
        }
        result.entry_count = packed.entry_count;
        advance(result, BuildStage::Packed);
    } catch (const std::exception& e) {
        spdlog::debug("build failed after {}: {}", build_stage_to_string(result.stage), e.what());
        throw;
    }

    result.ok = true;
    advance(result, BuildStage::Done);
    return result;
}

} // namespace topojar

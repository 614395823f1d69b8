#include "topojar/scratch_dir.hpp"
#include "topojar/platform.hpp"

#include <filesystem>
#include <system_error>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace topojar {

ScratchDir::ScratchDir(const std::string& parent) {
    fs::path base = parent.empty() ? fs::temp_directory_path() : fs::path(parent);
    fs::path dir = base / ("topojar_" + generate_uuid());

    // create_directory reports false for an existing path; a UUID clash is
    // treated the same as any other creation failure.
    if (!fs::create_directory(dir)) {
        throw fs::filesystem_error("scratch directory already exists", dir,
                                   std::make_error_code(std::errc::file_exists));
    }

    std::error_code ec;
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(dir, ignored);
        throw fs::filesystem_error("failed to restrict scratch directory", dir, ec);
    }

    path_ = dir.string();
    spdlog::debug("created scratch directory {}", path_);
}

ScratchDir::~ScratchDir() {
    remove();
}

bool ScratchDir::remove() {
    if (removed_) {
        return true;
    }
    removed_ = true;

    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        spdlog::warn("failed to remove scratch directory {}: {}", path_, ec.message());
        return false;
    }

    spdlog::debug("removed scratch directory {}", path_);
    return true;
}

} // namespace topojar

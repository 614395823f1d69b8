#pragma once

#include <string>

namespace topojar {

// Uniquely named temporary directory removed recursively on destruction.
// Removal tolerates partially populated trees and never throws.
class ScratchDir {
public:
    // Create "<parent>/topojar_<uuid>". An empty parent means the system
    // temp directory. Throws std::filesystem::filesystem_error on failure.
    explicit ScratchDir(const std::string& parent = "");
    ~ScratchDir();

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const std::string& path() const { return path_; }

    // Remove the directory now. Returns false if anything was left behind.
    bool remove();

private:
    std::string path_;
    bool removed_ = false;
};

} // namespace topojar

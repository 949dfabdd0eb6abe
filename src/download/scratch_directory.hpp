#pragma once

#include <filesystem>
#include <string>
#include "core/errors/server_errors.hpp"

namespace vidmcp::download {

// A private directory owned by one download. Removed with everything in it
// when the owner goes out of scope, whichever way the download ended.
class ScratchDirectory {
public:
    static core::errors::Result<ScratchDirectory> create(
        const std::filesystem::path& root, const std::string& prefix = "vidmcp-");

    ~ScratchDirectory();

    ScratchDirectory(ScratchDirectory&& other) noexcept;
    ScratchDirectory& operator=(ScratchDirectory&& other) noexcept;
    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    explicit ScratchDirectory(std::filesystem::path path);
    void release() noexcept;

    std::filesystem::path path_;
};

}  // namespace vidmcp::download

#include "download/scratch_directory.hpp"

#include <system_error>
#include <utility>
#include "core/config/unique_id.hpp"
#include "core/logging/logger.hpp"

namespace vidmcp::download {

using core::errors::ErrorCategory;
using core::errors::ServerError;

core::errors::Result<ScratchDirectory> ScratchDirectory::create(
    const std::filesystem::path& root, const std::string& prefix) {
    std::error_code ec;
    std::filesystem::create_directories(root, ec);
    if (ec || !std::filesystem::is_directory(root, ec)) {
        return ServerError{ErrorCategory::Resource,
                           "Scratch root is not a writable directory: " + root.string(),
                           "scratch_root_invalid"};
    }

    // create_directory reports false when the name is taken, which makes the
    // claim atomic across threads and processes.
    constexpr int kMaxAttempts = 16;
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        const auto candidate = root / core::config::generate_unique_id(prefix);
        ec.clear();
        const bool created = std::filesystem::create_directory(candidate, ec);
        if (ec) {
            return ServerError{ErrorCategory::Resource,
                               "Unable to create scratch directory: " +
                                   candidate.string() + " (" + ec.message() + ")",
                               "scratch_create_failed"};
        }
        if (created) {
            LOG_DEBUG("ScratchDirectory: acquired " + candidate.string());
            return ScratchDirectory(candidate);
        }
    }

    return ServerError{ErrorCategory::Resource,
                       "Unable to allocate unique scratch directory under " +
                           root.string(),
                       "scratch_create_failed"};
}

ScratchDirectory::ScratchDirectory(std::filesystem::path path)
    : path_(std::move(path)) {}

ScratchDirectory::~ScratchDirectory() {
    release();
}

ScratchDirectory::ScratchDirectory(ScratchDirectory&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

ScratchDirectory& ScratchDirectory::operator=(ScratchDirectory&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

void ScratchDirectory::release() noexcept {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        LOG_WARN("ScratchDirectory: failed to remove " + path_.string() + ": " +
                 ec.message());
    } else {
        LOG_DEBUG("ScratchDirectory: released " + path_.string());
    }
    path_.clear();
}

}  // namespace vidmcp::download

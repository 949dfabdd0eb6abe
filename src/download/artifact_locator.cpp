#include "download/artifact_locator.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <system_error>
#include <vector>

namespace vidmcp::download {

using core::errors::ErrorCategory;
using core::errors::ServerError;

namespace {

bool is_partial(const std::filesystem::path& path) {
    const auto ext = path.extension().string();
    return ext == ".part" || ext == ".ytdl" || ext == ".temp";
}

std::vector<std::filesystem::path> finished_files(const std::filesystem::path& dir) {
    std::vector<std::filesystem::path> files;
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec) || ec) {
        return files;
    }
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file(ec) || ec) {
            continue;
        }
        if (is_partial(entry.path())) {
            continue;
        }
        files.push_back(entry.path());
    }
    std::sort(files.begin(), files.end());
    return files;
}

}  // namespace

core::errors::Result<std::filesystem::path> locate_artifact(
    const std::filesystem::path& predicted, const std::filesystem::path& search_dir) {
    std::error_code ec;
    if (!predicted.empty()) {
        if (std::filesystem::is_regular_file(predicted, ec) && !ec) {
            return predicted;
        }

        const std::filesystem::path dir =
            predicted.has_parent_path() ? predicted.parent_path() : search_dir;
        const std::string stem_prefix = predicted.stem().string() + ".";
        for (const auto& candidate : finished_files(dir)) {
            if (candidate.filename().string().rfind(stem_prefix, 0) == 0) {
                return candidate;
            }
        }
        return ServerError{ErrorCategory::Extraction,
                           "Download completed but file not found: " +
                               predicted.filename().string(),
                           "artifact_not_found"};
    }

    const auto files = finished_files(search_dir);
    std::filesystem::path best;
    std::uintmax_t best_size = 0;
    for (const auto& candidate : files) {
        const auto size = std::filesystem::file_size(candidate, ec);
        if (ec) {
            continue;
        }
        if (best.empty() || size > best_size) {
            best = candidate;
            best_size = size;
        }
    }
    if (best.empty()) {
        return ServerError{ErrorCategory::Extraction,
                           "Download completed but file not found", "artifact_not_found"};
    }
    return best;
}

}  // namespace vidmcp::download

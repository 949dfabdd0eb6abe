#pragma once

#include <filesystem>
#include "core/errors/server_errors.hpp"

namespace vidmcp::download {

// Resolves the file a download actually produced. Post-processing may change
// the extension, so when `predicted` is missing the first "<stem>.*" sibling
// (lexicographic order) wins. With an empty prediction the only candidate is
// the largest finished file in `search_dir`. Partial downloads (.part, .ytdl)
// never match.
core::errors::Result<std::filesystem::path> locate_artifact(
    const std::filesystem::path& predicted, const std::filesystem::path& search_dir);

}  // namespace vidmcp::download

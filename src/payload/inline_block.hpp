#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "core/errors/server_errors.hpp"

namespace vidmcp::payload {

inline constexpr const char* kFileDataStart = "FILE_DATA_START";
inline constexpr const char* kFileDataEnd = "FILE_DATA_END";

struct InlineArtifact {
    std::string file_name;
    std::string mime_type;
    std::uintmax_t size = 0;
    std::string bytes;   // decoded
};

// FILE_DATA_START / <base64> / FILE_DATA_END, then FILENAME:, MIME_TYPE: and
// SIZE: lines. No trailing newline.
std::string render_inline_block(const std::string& base64, const std::string& file_name,
                                const std::string& mime_type, std::uintmax_t size);

// Finds the block inside a response text and decodes it. Errors:
// "inline_block_missing", "inline_metadata_missing", "invalid_base64",
// "inline_size_mismatch".
core::errors::Result<InlineArtifact> parse_inline_block(const std::string& text);

}  // namespace vidmcp::payload

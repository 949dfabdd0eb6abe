#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include "core/errors/server_errors.hpp"

namespace vidmcp::codec {

// Standard RFC 4648 alphabet with '=' padding, no line wrapping.
std::string base64_encode(const unsigned char* data, std::size_t size);
std::string base64_encode(const std::string& bytes);

// Encodes a file in fixed-size chunks without holding its raw bytes in memory.
core::errors::Result<std::string> base64_encode_file(const std::filesystem::path& path);

// Strict decoding: length must be a multiple of 4 and padding only at the end.
core::errors::Result<std::string> base64_decode(const std::string& encoded);

}  // namespace vidmcp::codec

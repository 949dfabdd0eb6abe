#include "codec/base64.hpp"

#include <array>
#include <cstdint>
#include <fstream>
#include <system_error>

namespace vidmcp::codec {

using core::errors::ErrorCategory;
using core::errors::ServerError;

namespace {

constexpr char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::array<int, 256> make_decoding_table() {
    std::array<int, 256> table{};
    table.fill(-1);
    for (int i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(kAlphabet[i])] = i;
    }
    return table;
}

void encode_into(std::string& out, const unsigned char* data, const std::size_t size) {
    std::size_t i = 0;
    for (; i + 2 < size; i += 3) {
        const std::uint32_t triple = (static_cast<std::uint32_t>(data[i]) << 16) |
                                     (static_cast<std::uint32_t>(data[i + 1]) << 8) |
                                     static_cast<std::uint32_t>(data[i + 2]);
        out.push_back(kAlphabet[(triple >> 18) & 0x3F]);
        out.push_back(kAlphabet[(triple >> 12) & 0x3F]);
        out.push_back(kAlphabet[(triple >> 6) & 0x3F]);
        out.push_back(kAlphabet[triple & 0x3F]);
    }

    const std::size_t remaining = size - i;
    if (remaining == 0) {
        return;
    }
    std::uint32_t triple = static_cast<std::uint32_t>(data[i]) << 16;
    if (remaining == 2) {
        triple |= static_cast<std::uint32_t>(data[i + 1]) << 8;
    }
    out.push_back(kAlphabet[(triple >> 18) & 0x3F]);
    out.push_back(kAlphabet[(triple >> 12) & 0x3F]);
    out.push_back(remaining == 2 ? kAlphabet[(triple >> 6) & 0x3F] : '=');
    out.push_back('=');
}

}  // namespace

std::string base64_encode(const unsigned char* data, const std::size_t size) {
    std::string out;
    out.reserve(((size + 2) / 3) * 4);
    encode_into(out, data, size);
    return out;
}

std::string base64_encode(const std::string& bytes) {
    return base64_encode(reinterpret_cast<const unsigned char*>(bytes.data()),
                         bytes.size());
}

core::errors::Result<std::string> base64_encode_file(const std::filesystem::path& path) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return ServerError{ErrorCategory::Resource,
                           "Unable to stat file for encoding: " + path.string(),
                           "encode_stat_failed"};
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return ServerError{ErrorCategory::Resource,
                           "Unable to open file for encoding: " + path.string(),
                           "encode_open_failed"};
    }

    std::string out;
    out.reserve(((static_cast<std::size_t>(size) + 2) / 3) * 4);

    // Multiple of 3 so only the last chunk can produce padding.
    constexpr std::size_t kChunkSize = 3 * 64 * 1024;
    std::string chunk(kChunkSize, '\0');
    while (in) {
        in.read(&chunk[0], static_cast<std::streamsize>(kChunkSize));
        const std::streamsize read_bytes = in.gcount();
        if (read_bytes <= 0) {
            break;
        }
        encode_into(out, reinterpret_cast<const unsigned char*>(chunk.data()),
                    static_cast<std::size_t>(read_bytes));
    }
    if (in.bad()) {
        return ServerError{ErrorCategory::Resource,
                           "I/O error while encoding file: " + path.string(),
                           "encode_read_failed"};
    }
    return out;
}

core::errors::Result<std::string> base64_decode(const std::string& encoded) {
    static const std::array<int, 256> kTable = make_decoding_table();

    if (encoded.size() % 4 != 0) {
        return ServerError{ErrorCategory::Input,
                           "Base64 length must be a multiple of 4.",
                           "invalid_base64"};
    }

    std::string out;
    out.reserve((encoded.size() / 4) * 3);
    for (std::size_t i = 0; i < encoded.size(); i += 4) {
        const bool last_group = (i + 4 == encoded.size());
        int values[4];
        int padding = 0;
        for (std::size_t j = 0; j < 4; ++j) {
            const char c = encoded[i + j];
            if (c == '=') {
                // Padding allowed only in the final two positions of the last group.
                if (!last_group || j < 2) {
                    return ServerError{ErrorCategory::Input,
                                       "Unexpected base64 padding.",
                                       "invalid_base64"};
                }
                values[j] = 0;
                ++padding;
                continue;
            }
            if (padding > 0) {
                return ServerError{ErrorCategory::Input,
                                   "Base64 data after padding.", "invalid_base64"};
            }
            values[j] = kTable[static_cast<unsigned char>(c)];
            if (values[j] < 0) {
                return ServerError{ErrorCategory::Input,
                                   "Invalid base64 character.", "invalid_base64"};
            }
        }

        const std::uint32_t triple = (static_cast<std::uint32_t>(values[0]) << 18) |
                                     (static_cast<std::uint32_t>(values[1]) << 12) |
                                     (static_cast<std::uint32_t>(values[2]) << 6) |
                                     static_cast<std::uint32_t>(values[3]);
        out.push_back(static_cast<char>((triple >> 16) & 0xFF));
        if (padding < 2) {
            out.push_back(static_cast<char>((triple >> 8) & 0xFF));
        }
        if (padding < 1) {
            out.push_back(static_cast<char>(triple & 0xFF));
        }
    }
    return out;
}

}  // namespace vidmcp::codec

#include "payload/inline_block.hpp"

#include <charconv>
#include <sstream>
#include <system_error>
#include <utility>
#include "codec/base64.hpp"

namespace vidmcp::payload {

using core::errors::ErrorCategory;
using core::errors::ServerError;

namespace {

// Value of the first "<key>: ..." line at or after `from`.
std::optional<std::string> metadata_value(const std::string& text,
                                          const std::string& key,
                                          const std::size_t from) {
    const std::string marker = "\n" + key + ": ";
    const std::size_t pos = text.find(marker, from);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    const std::size_t begin = pos + marker.size();
    const std::size_t end = text.find('\n', begin);
    return text.substr(begin, end == std::string::npos ? std::string::npos : end - begin);
}

}  // namespace

std::string render_inline_block(const std::string& base64, const std::string& file_name,
                                const std::string& mime_type, const std::uintmax_t size) {
    std::ostringstream out;
    out << kFileDataStart << "\n"
        << base64 << "\n"
        << kFileDataEnd << "\n"
        << "FILENAME: " << file_name << "\n"
        << "MIME_TYPE: " << mime_type << "\n"
        << "SIZE: " << size;
    return out.str();
}

core::errors::Result<InlineArtifact> parse_inline_block(const std::string& text) {
    const std::string start_marker = std::string(kFileDataStart) + "\n";
    const std::string end_marker = std::string("\n") + kFileDataEnd;

    const std::size_t start = text.find(start_marker);
    if (start == std::string::npos) {
        return ServerError{ErrorCategory::Input, "No FILE_DATA_START marker found.",
                           "inline_block_missing"};
    }
    const std::size_t data_begin = start + start_marker.size();
    // Empty payload renders as an empty line between the markers.
    const std::size_t end = text.find(end_marker, data_begin - 1);
    if (end == std::string::npos) {
        return ServerError{ErrorCategory::Input, "No FILE_DATA_END marker found.",
                           "inline_block_missing"};
    }

    const std::string encoded =
        end < data_begin ? std::string() : text.substr(data_begin, end - data_begin);

    const std::size_t metadata_from = end + 1;
    const auto file_name = metadata_value(text, "FILENAME", metadata_from);
    const auto mime_type = metadata_value(text, "MIME_TYPE", metadata_from);
    const auto size_text = metadata_value(text, "SIZE", metadata_from);
    if (!file_name || !mime_type || !size_text) {
        return ServerError{ErrorCategory::Input,
                           "Inline block is missing FILENAME, MIME_TYPE or SIZE.",
                           "inline_metadata_missing"};
    }

    std::uintmax_t size = 0;
    const char* begin = size_text->data();
    const char* finish = size_text->data() + size_text->size();
    auto [ptr, ec] = std::from_chars(begin, finish, size);
    if (ec != std::errc() || ptr != finish) {
        return ServerError{ErrorCategory::Input, "Invalid SIZE value: " + *size_text,
                           "inline_metadata_missing"};
    }

    auto decoded = codec::base64_decode(encoded);
    if (core::errors::is_error(decoded)) {
        return core::errors::get_error(decoded);
    }

    InlineArtifact artifact;
    artifact.file_name = *file_name;
    artifact.mime_type = *mime_type;
    artifact.size = size;
    artifact.bytes = core::errors::take_value(std::move(decoded));
    if (artifact.bytes.size() != size) {
        return ServerError{ErrorCategory::Input,
                           "Decoded " + std::to_string(artifact.bytes.size()) +
                               " bytes but SIZE says " + std::to_string(size),
                           "inline_size_mismatch"};
    }
    return artifact;
}

}  // namespace vidmcp::payload

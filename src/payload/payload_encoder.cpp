#include "payload/payload_encoder.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <system_error>
#include <unistd.h>
#include <unordered_map>
#include <utility>
#include "codec/base64.hpp"
#include "core/config/unique_id.hpp"
#include "core/logging/logger.hpp"

namespace vidmcp::payload {

using core::errors::ErrorCategory;
using core::errors::ServerError;

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

core::errors::Result<std::uintmax_t> regular_file_size(
    const std::filesystem::path& artifact) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(artifact, ec) || ec) {
        return ServerError{ErrorCategory::Resource,
                           "Artifact is not a regular file: " + artifact.string(),
                           "artifact_missing"};
    }
    const auto size = std::filesystem::file_size(artifact, ec);
    if (ec) {
        return ServerError{ErrorCategory::Resource,
                           "Unable to read artifact size: " + artifact.string(),
                           "artifact_stat_failed"};
    }
    return size;
}

// Claims "<stem>.<ext>", or "<stem>-<id>.<ext>" when the name is taken, by
// creating an empty placeholder with O_EXCL. The caller owns the placeholder.
core::errors::Result<std::filesystem::path> claim_destination(
    const std::filesystem::path& dir, const std::filesystem::path& file_name) {
    auto candidate = dir / file_name;
    constexpr int kMaxAttempts = 16;
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        const int fd =
            ::open(candidate.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
        if (fd >= 0) {
            ::close(fd);
            return candidate;
        }
        if (errno != EEXIST) {
            return ServerError{ErrorCategory::Resource,
                               "Unable to create " + candidate.string() + ": " +
                                   std::strerror(errno),
                               "shared_file_create_failed"};
        }
        candidate = dir / (file_name.stem().string() +
                           core::config::generate_unique_id("-") +
                           file_name.extension().string());
    }
    return ServerError{ErrorCategory::Resource,
                       "No free file name in shared directory for " +
                           file_name.string(),
                       "shared_name_exhausted"};
}

}  // namespace

std::string mime_type_for(const std::filesystem::path& path) {
    static const std::unordered_map<std::string, std::string> kMimeTypes = {
        {".mp4", "video/mp4"},        {".webm", "video/webm"},
        {".mkv", "video/x-matroska"}, {".mov", "video/quicktime"},
        {".avi", "video/x-msvideo"},  {".flv", "video/x-flv"},
        {".m4a", "audio/mp4"},        {".mp3", "audio/mpeg"},
        {".ogg", "audio/ogg"},        {".opus", "audio/opus"},
        {".wav", "audio/wav"},        {".aac", "audio/aac"},
        {".flac", "audio/flac"}};

    const auto it = kMimeTypes.find(lowercase(path.extension().string()));
    if (it == kMimeTypes.end()) {
        return "application/octet-stream";
    }
    return it->second;
}

InlinePayloadEncoder::InlinePayloadEncoder(const std::uintmax_t max_bytes)
    : max_bytes_(max_bytes) {}

core::errors::Result<EncodedArtifact> InlinePayloadEncoder::encode(
    const std::filesystem::path& artifact) const {
    auto size_result = regular_file_size(artifact);
    if (core::errors::is_error(size_result)) {
        return core::errors::get_error(size_result);
    }
    const auto size = core::errors::get_value(size_result);

    if (max_bytes_ > 0 && size > max_bytes_) {
        return ServerError{ErrorCategory::Resource,
                           "Artifact is too large to inline: " + std::to_string(size) +
                               " bytes exceeds the limit of " +
                               std::to_string(max_bytes_) + " bytes",
                           "payload_too_large",
                           "Lower the quality, use audio_only, or run in file mode."};
    }

    auto encoded = codec::base64_encode_file(artifact);
    if (core::errors::is_error(encoded)) {
        return core::errors::get_error(encoded);
    }

    EncodedArtifact result;
    result.file_name = artifact.filename().string();
    result.file_size_bytes = size;
    result.mime_type = mime_type_for(artifact);
    result.payload = protocol::InlineBytes{core::errors::take_value(std::move(encoded))};
    LOG_DEBUG("InlinePayloadEncoder: encoded " + result.file_name + " (" +
              std::to_string(size) + " bytes)");
    return result;
}

FileRefPayloadEncoder::FileRefPayloadEncoder(std::filesystem::path shared_dir)
    : shared_dir_(std::move(shared_dir)) {}

core::errors::Result<EncodedArtifact> FileRefPayloadEncoder::encode(
    const std::filesystem::path& artifact) const {
    auto size_result = regular_file_size(artifact);
    if (core::errors::is_error(size_result)) {
        return core::errors::get_error(size_result);
    }
    const auto size = core::errors::get_value(size_result);

    std::error_code ec;
    std::filesystem::create_directories(shared_dir_, ec);
    if (ec) {
        return ServerError{ErrorCategory::Resource,
                           "Unable to create shared directory: " + shared_dir_.string(),
                           "shared_dir_create_failed"};
    }

    auto claimed = claim_destination(shared_dir_, artifact.filename());
    if (core::errors::is_error(claimed)) {
        return core::errors::get_error(claimed);
    }
    const auto destination = core::errors::get_value(claimed);

    // Replaces only the placeholder claimed above.
    std::filesystem::rename(artifact, destination, ec);
    if (ec) {
        // Scratch and shared directories may sit on different filesystems.
        ec.clear();
        std::filesystem::copy_file(artifact, destination,
                                   std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            std::error_code cleanup;
            std::filesystem::remove(destination, cleanup);
            return ServerError{ErrorCategory::Resource,
                               "Unable to move artifact into shared directory: " +
                                   destination.string(),
                               "artifact_move_failed"};
        }
        std::filesystem::remove(artifact, ec);
    }

    EncodedArtifact result;
    result.file_name = destination.filename().string();
    result.file_size_bytes = size;
    result.mime_type = mime_type_for(destination);
    result.payload = protocol::FileRef{destination.string()};
    LOG_DEBUG("FileRefPayloadEncoder: stored " + destination.string());
    return result;
}

std::shared_ptr<const PayloadEncoder> make_payload_encoder(
    const core::config::ServerConfig& config) {
    switch (config.payload_mode) {
        case core::config::PayloadMode::FileRef:
            return std::make_shared<FileRefPayloadEncoder>(config.shared_dir);
        case core::config::PayloadMode::Inline:
        default:
            return std::make_shared<InlinePayloadEncoder>(config.max_inline_bytes);
    }
}

}  // namespace vidmcp::payload

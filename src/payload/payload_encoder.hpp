#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include "core/config/server_config.hpp"
#include "core/errors/server_errors.hpp"
#include "protocol/download_contract.hpp"

namespace vidmcp::payload {

struct EncodedArtifact {
    std::string file_name;
    std::uintmax_t file_size_bytes = 0;
    std::string mime_type;
    protocol::Payload payload;
};

// Fixed extension table, case-insensitive; unknown -> application/octet-stream.
std::string mime_type_for(const std::filesystem::path& path);

// Turns a finished artifact into something that can travel in a response.
// Called while the artifact still sits in its scratch directory.
class PayloadEncoder {
public:
    virtual ~PayloadEncoder() = default;

    virtual core::errors::Result<EncodedArtifact> encode(
        const std::filesystem::path& artifact) const = 0;

    virtual core::config::PayloadMode mode() const = 0;
};

// Base64 of the whole artifact. max_bytes == 0 disables the size cap.
class InlinePayloadEncoder : public PayloadEncoder {
public:
    explicit InlinePayloadEncoder(std::uintmax_t max_bytes = 0);

    core::errors::Result<EncodedArtifact> encode(
        const std::filesystem::path& artifact) const override;

    core::config::PayloadMode mode() const override {
        return core::config::PayloadMode::Inline;
    }

private:
    std::uintmax_t max_bytes_;
};

// Moves the artifact into a directory shared with the client.
class FileRefPayloadEncoder : public PayloadEncoder {
public:
    explicit FileRefPayloadEncoder(std::filesystem::path shared_dir);

    core::errors::Result<EncodedArtifact> encode(
        const std::filesystem::path& artifact) const override;

    core::config::PayloadMode mode() const override {
        return core::config::PayloadMode::FileRef;
    }

private:
    std::filesystem::path shared_dir_;
};

std::shared_ptr<const PayloadEncoder> make_payload_encoder(
    const core::config::ServerConfig& config);

}  // namespace vidmcp::payload

#pragma once

#include <filesystem>
#include <memory>
#include "download/extractor.hpp"
#include "payload/payload_encoder.hpp"
#include "protocol/download_contract.hpp"

namespace vidmcp::download {

// Runs one download end to end: format selection, a private scratch
// directory, extraction, artifact lookup and payload encoding.
//
// download() blocks for the whole extraction and is meant to be called from a
// worker thread. It keeps no state between calls, so concurrent downloads
// share nothing but the extractor and encoder, and it never throws.
class DownloadOrchestrator {
public:
    DownloadOrchestrator(std::filesystem::path scratch_root,
                         std::shared_ptr<Extractor> extractor,
                         std::shared_ptr<const payload::PayloadEncoder> encoder);

    protocol::DownloadResult download(const protocol::DownloadOptions& options) const;

    core::config::PayloadMode payload_mode() const;

private:
    std::filesystem::path scratch_root_;
    std::shared_ptr<Extractor> extractor_;
    std::shared_ptr<const payload::PayloadEncoder> encoder_;
};

}  // namespace vidmcp::download

#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include "core/errors/server_errors.hpp"
#include "protocol/event_contract.hpp"

namespace vidmcp::download {

using ProgressCallback = std::function<void(const protocol::ProgressEvent& event)>;

struct ExtractionRequest {
    std::string url;
    std::string format_constraint;
    bool audio_only = false;
    std::filesystem::path output_directory;   // private to this invocation
};

struct ExtractionInfo {
    std::string title;
    std::string uploader;
    double duration_seconds = 0.0;
    std::int64_t view_count = 0;
    std::filesystem::path downloaded_file;   // predicted path, may be stale
};

// The external capability that understands media sites. extract() runs
// synchronously and reports progress through the callback on the calling
// thread. Failures come back as ErrorCategory::Extraction. Implementations
// must tolerate concurrent extract() calls from several workers.
class Extractor {
public:
    virtual ~Extractor() = default;

    virtual core::errors::Result<ExtractionInfo> extract(
        const ExtractionRequest& request, const ProgressCallback& on_progress) = 0;
};

}  // namespace vidmcp::download

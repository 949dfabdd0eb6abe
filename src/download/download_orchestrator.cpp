#include "download/download_orchestrator.hpp"

#include <exception>
#include <string>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"
#include "download/artifact_locator.hpp"
#include "download/format_selector.hpp"
#include "download/scratch_directory.hpp"

namespace vidmcp::download {

using protocol::DownloadFailure;
using protocol::DownloadResult;
using protocol::DownloadState;
using protocol::DownloadSuccess;

DownloadOrchestrator::DownloadOrchestrator(
    std::filesystem::path scratch_root, std::shared_ptr<Extractor> extractor,
    std::shared_ptr<const payload::PayloadEncoder> encoder)
    : scratch_root_(std::move(scratch_root)),
      extractor_(std::move(extractor)),
      encoder_(std::move(encoder)) {}

core::config::PayloadMode DownloadOrchestrator::payload_mode() const {
    return encoder_->mode();
}

DownloadResult DownloadOrchestrator::download(
    const protocol::DownloadOptions& options) const {
    DownloadState state = DownloadState::Idle;
    auto advance = [&state, &options](const DownloadState next) {
        LOG_DEBUG("DownloadOrchestrator: " + options.url + " " +
                  protocol::to_string(state) + " -> " + protocol::to_string(next));
        state = next;
    };
    auto fail = [&advance](const std::string& message) -> DownloadResult {
        advance(DownloadState::Failed);
        LOG_WARN("DownloadOrchestrator: " + message);
        return DownloadFailure{message};
    };

    try {
        advance(DownloadState::Resolving);
        ExtractionRequest request;
        request.url = options.url;
        request.audio_only = options.audio_only;
        request.format_constraint = format_constraint(options.quality, options.audio_only);

        auto scratch_result = ScratchDirectory::create(scratch_root_);
        if (core::errors::is_error(scratch_result)) {
            return fail(core::errors::get_error(scratch_result).message);
        }
        // Removed on every path out of this scope.
        const ScratchDirectory scratch =
            core::errors::take_value(std::move(scratch_result));
        request.output_directory = scratch.path();

        // Owned by this invocation only.
        std::vector<std::string> progress_log;
        auto on_progress = [&progress_log](const protocol::ProgressEvent& event) {
            progress_log.push_back(protocol::describe(event));
        };

        advance(DownloadState::Downloading);
        auto extracted = extractor_->extract(request, on_progress);
        if (core::errors::is_error(extracted)) {
            return fail(core::errors::get_error(extracted).message);
        }
        const auto& info = core::errors::get_value(extracted);

        advance(DownloadState::Finished);
        auto located = locate_artifact(info.downloaded_file, scratch.path());
        if (core::errors::is_error(located)) {
            return fail(core::errors::get_error(located).message);
        }

        advance(DownloadState::Encoding);
        auto encoded = encoder_->encode(core::errors::get_value(located));
        if (core::errors::is_error(encoded)) {
            return fail(core::errors::get_error(encoded).message);
        }
        auto artifact = core::errors::take_value(std::move(encoded));

        DownloadSuccess success;
        success.title = info.title;
        success.uploader = info.uploader;
        success.duration_seconds = info.duration_seconds;
        success.view_count = info.view_count;
        success.file_name = std::move(artifact.file_name);
        success.file_size_bytes = artifact.file_size_bytes;
        success.mime_type = std::move(artifact.mime_type);
        success.progress_log = std::move(progress_log);
        success.payload = std::move(artifact.payload);

        advance(DownloadState::Done);
        LOG_INFO("DownloadOrchestrator: downloaded " + success.file_name + " (" +
                 std::to_string(success.file_size_bytes) + " bytes) from " +
                 options.url);
        return success;
    } catch (const std::exception& e) {
        return fail(std::string("Unexpected error during download: ") + e.what());
    }
}

}  // namespace vidmcp::download

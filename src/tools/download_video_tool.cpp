#include "tools/download_video_tool.hpp"

#include <cstdio>
#include <sstream>
#include <type_traits>
#include <utility>
#include <variant>
#include "core/logging/logger.hpp"
#include "download/format_selector.hpp"
#include "payload/inline_block.hpp"
#include "policy/url_policy.hpp"

namespace vidmcp::tools {

using core::errors::ErrorCategory;
using core::errors::ServerError;
using nlohmann::json;

namespace {

std::string with_thousands(std::int64_t value) {
    const bool negative = value < 0;
    std::string digits = std::to_string(negative ? -value : value);
    std::string out;
    for (std::size_t i = 0; i < digits.size(); ++i) {
        if (i != 0 && (digits.size() - i) % 3 == 0) {
            out.push_back(',');
        }
        out.push_back(digits[i]);
    }
    return negative ? "-" + out : out;
}

std::string one_decimal(const double value) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.1f", value);
    return buffer;
}

}  // namespace

protocol::ToolDescriptor download_video_descriptor() {
    protocol::ToolDescriptor descriptor;
    descriptor.name = kDownloadVideoTool;
    descriptor.description =
        "Download videos from various platforms (YouTube, Vimeo, etc.) using yt-dlp. "
        "Supports quality selection and audio-only (MP3) extraction. The downloaded "
        "file is returned in the response as a base64 block between FILE_DATA_START "
        "and FILE_DATA_END, followed by FILENAME, MIME_TYPE and SIZE lines, or as a "
        "path in the shared downloads directory when the server runs in file mode.";
    descriptor.input_schema = json{
        {"type", "object"},
        {"properties",
         {{"url",
           {{"type", "string"},
            {"description",
             "The URL of the video to download. Supports YouTube, Vimeo, and many "
             "other platforms."}}},
          {"quality",
           {{"type", "string"},
            {"enum", {"best", "worst", "720p", "480p", "360p"}},
            {"description",
             "Video quality preference. 'best' downloads the highest available "
             "quality, the others limit the maximum resolution."},
            {"default", "720p"}}},
          {"audio_only",
           {{"type", "boolean"},
            {"description",
             "If true, extracts audio only (MP3 format). If false, downloads video."},
            {"default", false}}}}},
        {"required", {"url"}}};
    return descriptor;
}

core::errors::Result<protocol::DownloadOptions> parse_download_arguments(
    const json& arguments) {
    if (!arguments.is_object()) {
        return ServerError{ErrorCategory::Input, "Tool arguments must be an object.",
                           "invalid_arguments"};
    }

    const auto url = arguments.find("url");
    if (url == arguments.end() || !url->is_string()) {
        return ServerError{ErrorCategory::Input,
                           "Invalid URL provided. Please provide a valid video URL.",
                           "empty_url"};
    }

    const policy::UrlPolicy url_policy;
    auto validated = url_policy.validate_url(url->get<std::string>());
    if (core::errors::is_error(validated)) {
        return core::errors::get_error(validated);
    }

    protocol::DownloadOptions options;
    options.url = core::errors::get_value(validated);

    const auto quality = arguments.find("quality");
    if (quality != arguments.end() && quality->is_string()) {
        options.quality = download::parse_quality(quality->get<std::string>());
    }

    const auto audio_only = arguments.find("audio_only");
    if (audio_only != arguments.end() && audio_only->is_boolean()) {
        options.audio_only = audio_only->get<bool>();
    }
    return options;
}

std::string render_download_success(const protocol::DownloadSuccess& success,
                                    const bool audio_only) {
    std::ostringstream out;
    out << "Video downloaded successfully!\n\n";
    out << "Title: " << success.title << "\n";
    out << "Uploader: " << success.uploader << "\n";
    if (success.duration_seconds > 0.0) {
        out << "Duration: " << one_decimal(success.duration_seconds / 60.0)
            << " minutes\n";
    }
    if (success.view_count > 0) {
        out << "Views: " << with_thousands(success.view_count) << "\n";
    }

    const auto* file_ref = std::get_if<protocol::FileRef>(&success.payload);
    out << "File: " << (file_ref != nullptr ? file_ref->path : success.file_name)
        << "\n";
    out << "Size: "
        << one_decimal(static_cast<double>(success.file_size_bytes) / (1024.0 * 1024.0))
        << " MB\n";
    out << "Mode: " << (audio_only ? "Audio Only (MP3)" : "Video") << "\n";

    out << "\nProgress Log:\n";
    for (const auto& entry : success.progress_log) {
        out << "  - " << entry << "\n";
    }

    if (const auto* bytes = std::get_if<protocol::InlineBytes>(&success.payload)) {
        out << "\nFile Data (Base64):\n"
            << payload::render_inline_block(bytes->base64, success.file_name,
                                            success.mime_type, success.file_size_bytes);
    }

    std::string text = out.str();
    while (!text.empty() && text.back() == '\n') {
        text.pop_back();
    }
    return text;
}

DownloadVideoTool::DownloadVideoTool(
    std::shared_ptr<const download::DownloadOrchestrator> orchestrator)
    : orchestrator_(std::move(orchestrator)) {}

protocol::ToolResult DownloadVideoTool::operator()(const json& arguments) const {
    auto parsed = parse_download_arguments(arguments);
    if (core::errors::is_error(parsed)) {
        const auto& err = core::errors::get_error(parsed);
        LOG_WARN("download_video: rejected arguments [" + err.code + "]: " + err.message);
        return protocol::text_result("Error: " + err.message, true);
    }
    const auto& options = core::errors::get_value(parsed);

    LOG_INFO("download_video: " + options.url + " quality=" +
             protocol::to_string(options.quality) +
             (options.audio_only ? " audio_only" : ""));
    const auto result = orchestrator_->download(options);

    return std::visit(
        [&options](const auto& outcome) -> protocol::ToolResult {
            using T = std::decay_t<decltype(outcome)>;
            if constexpr (std::is_same_v<T, protocol::DownloadSuccess>) {
                return protocol::text_result(
                    render_download_success(outcome, options.audio_only));
            } else {
                return protocol::text_result("Video download error: " + outcome.message,
                                             true);
            }
        },
        result);
}

core::errors::Result<std::size_t> register_download_video(
    ToolRegistry& registry,
    std::shared_ptr<const download::DownloadOrchestrator> orchestrator) {
    return registry.register_tool(download_video_descriptor(),
                                  DownloadVideoTool(std::move(orchestrator)));
}

}  // namespace vidmcp::tools

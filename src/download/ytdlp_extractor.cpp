#include "download/ytdlp_extractor.hpp"

#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "runtime/process_runner.hpp"

namespace vidmcp::download {

using core::errors::ErrorCategory;
using core::errors::ServerError;
using nlohmann::json;

namespace {

constexpr const char* kProgressTemplate =
    "download:[vidmcp-progress] %(progress.status)s|%(progress._percent_str)s|"
    "%(progress._speed_str)s|%(progress.filename)s";
constexpr const char* kResultTemplate =
    "after_move:[vidmcp-result] %(.{title,uploader,duration,view_count,filepath})j";

bool starts_with(const std::string& text, const char* prefix) {
    return text.rfind(prefix, 0) == 0;
}

std::vector<std::string> split_fields(const std::string& text, const char delimiter,
                                      const std::size_t max_fields) {
    std::vector<std::string> fields;
    std::size_t begin = 0;
    while (fields.size() + 1 < max_fields) {
        const std::size_t pos = text.find(delimiter, begin);
        if (pos == std::string::npos) {
            break;
        }
        fields.push_back(text.substr(begin, pos - begin));
        begin = pos + 1;
    }
    fields.push_back(text.substr(begin));
    return fields;
}

std::string string_field(const json& info, const char* key, const char* fallback) {
    const auto it = info.find(key);
    if (it == info.end() || !it->is_string() || it->get<std::string>().empty()) {
        return fallback;
    }
    return it->get<std::string>();
}

// yt-dlp reports failures as "ERROR: ..." on stderr; the last one is the cause.
std::string last_error_line(const std::string& stderr_text) {
    std::string last;
    std::size_t begin = 0;
    while (begin < stderr_text.size()) {
        std::size_t end = stderr_text.find('\n', begin);
        if (end == std::string::npos) {
            end = stderr_text.size();
        }
        const std::string line = stderr_text.substr(begin, end - begin);
        if (starts_with(line, "ERROR: ")) {
            last = line.substr(7);
        }
        begin = end + 1;
    }
    return last;
}

}  // namespace

YtDlpExtractor::YtDlpExtractor(YtDlpConfig config) : config_(std::move(config)) {}

std::vector<std::string> YtDlpExtractor::build_arguments(
    const ExtractionRequest& request) const {
    std::vector<std::string> args = {
        config_.binary,
        "--no-playlist",
        "--no-warnings",
        "--newline",
        "--progress",
        "--no-simulate",
        "--progress-template", kProgressTemplate,
        "--print", kResultTemplate,
        "-f", request.format_constraint,
        "-o", (request.output_directory / "%(title).200B.%(ext)s").string()};

    if (request.audio_only) {
        args.insert(args.end(), {"-x", "--audio-format", "mp3", "--audio-quality", "192K"});
    }

    // "--" keeps a URL that starts with '-' from being read as an option.
    args.emplace_back("--");
    args.push_back(request.url);
    return args;
}

std::optional<protocol::ProgressEvent> YtDlpExtractor::parse_progress_line(
    const std::string& line) {
    if (!starts_with(line, kProgressPrefix)) {
        return std::nullopt;
    }
    const auto fields =
        split_fields(line.substr(std::string(kProgressPrefix).size()), '|', 4);
    if (fields.size() != 4) {
        return std::nullopt;
    }

    const std::string& status = fields[0];
    if (status == "downloading") {
        return protocol::DownloadingEvent{fields[1], fields[2], fields[3]};
    }
    if (status == "finished") {
        return protocol::FinishedEvent{fields[3]};
    }
    if (status == "error") {
        return protocol::ErrorEvent{"yt-dlp reported an error for " +
                                    protocol::base_name(fields[3])};
    }
    return std::nullopt;
}

core::errors::Result<ExtractionInfo> YtDlpExtractor::parse_result_line(
    const std::string& line) {
    if (!starts_with(line, kResultPrefix)) {
        return ServerError{ErrorCategory::Extraction, "Not a yt-dlp result line.",
                           "extractor_bad_output"};
    }
    const json info =
        json::parse(line.substr(std::string(kResultPrefix).size()), nullptr, false);
    if (info.is_discarded() || !info.is_object()) {
        return ServerError{ErrorCategory::Extraction,
                           "Could not parse video information from yt-dlp.",
                           "extractor_bad_output"};
    }

    ExtractionInfo result;
    result.title = string_field(info, "title", "Unknown Title");
    result.uploader = string_field(info, "uploader", "Unknown");

    const auto duration = info.find("duration");
    if (duration != info.end() && duration->is_number()) {
        result.duration_seconds = duration->get<double>();
    }
    const auto views = info.find("view_count");
    if (views != info.end() && views->is_number()) {
        result.view_count = views->is_number_float()
                                ? static_cast<std::int64_t>(views->get<double>())
                                : views->get<std::int64_t>();
    }
    const auto filepath = info.find("filepath");
    if (filepath != info.end() && filepath->is_string()) {
        result.downloaded_file = filepath->get<std::string>();
    }
    return result;
}

core::errors::Result<ExtractionInfo> YtDlpExtractor::extract(
    const ExtractionRequest& request, const ProgressCallback& on_progress) {
    std::optional<ExtractionInfo> info;

    auto handle_line = [&](const std::string& line) {
        if (auto event = parse_progress_line(line)) {
            if (on_progress) {
                on_progress(*event);
            }
            return;
        }
        if (starts_with(line, kResultPrefix)) {
            auto parsed = parse_result_line(line);
            if (core::errors::is_error(parsed)) {
                LOG_WARN("YtDlpExtractor: " + core::errors::get_error(parsed).message);
                return;
            }
            info = core::errors::get_value(parsed);
        }
    };

    runtime::ProcessRequest process;
    process.argv = build_arguments(request);
    process.working_directory = request.output_directory;
    process.timeout_ms = config_.timeout_ms;

    LOG_DEBUG("YtDlpExtractor: starting " + config_.binary + " for " + request.url +
              " (format " + request.format_constraint + ")");
    auto capture_result = runtime::run_process(process, handle_line, handle_line);
    if (core::errors::is_error(capture_result)) {
        const auto& err = core::errors::get_error(capture_result);
        return ServerError{ErrorCategory::Extraction,
                           "yt-dlp download error: " + err.message, err.code};
    }
    const auto& capture = core::errors::get_value(capture_result);

    auto fail = [&](const std::string& reason, const std::string& code) {
        if (on_progress) {
            on_progress(protocol::ErrorEvent{reason});
        }
        return ServerError{ErrorCategory::Extraction, "yt-dlp download error: " + reason,
                           code};
    };

    if (capture.timed_out) {
        return fail("timed out after " + std::to_string(config_.timeout_ms) + " ms",
                    "extractor_timeout");
    }
    if (capture.exit_code == 127) {
        return fail("executable not found: " + config_.binary, "extractor_missing");
    }
    if (capture.exit_code != 0) {
        std::string reason = last_error_line(capture.stderr_text);
        if (reason.empty()) {
            reason = "exited with code " + std::to_string(capture.exit_code);
        }
        return fail(reason, "extractor_failed");
    }

    if (!info.has_value()) {
        // Older yt-dlp builds without after_move printing; the caller falls
        // back to scanning the output directory.
        LOG_WARN("YtDlpExtractor: no result line from " + config_.binary);
        ExtractionInfo fallback;
        fallback.title = "Unknown Title";
        fallback.uploader = "Unknown";
        return fallback;
    }
    return *info;
}

}  // namespace vidmcp::download

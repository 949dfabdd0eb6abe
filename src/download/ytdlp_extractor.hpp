#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "download/extractor.hpp"

namespace vidmcp::download {

struct YtDlpConfig {
    std::string binary = "yt-dlp";
    std::uint32_t timeout_ms = 0;
};

// Runs the yt-dlp executable per download. Progress and the final metadata
// are requested through output templates carrying fixed line prefixes, and
// are parsed from the child's pipes; the child never shares this process's
// stdout.
class YtDlpExtractor : public Extractor {
public:
    static constexpr const char* kProgressPrefix = "[vidmcp-progress] ";
    static constexpr const char* kResultPrefix = "[vidmcp-result] ";

    explicit YtDlpExtractor(YtDlpConfig config = {});

    core::errors::Result<ExtractionInfo> extract(
        const ExtractionRequest& request, const ProgressCallback& on_progress) override;

    std::vector<std::string> build_arguments(const ExtractionRequest& request) const;

    // "<status>|<percent>|<speed>|<filename>" after kProgressPrefix.
    static std::optional<protocol::ProgressEvent> parse_progress_line(
        const std::string& line);

    // JSON object after kResultPrefix.
    static core::errors::Result<ExtractionInfo> parse_result_line(const std::string& line);

private:
    YtDlpConfig config_;
};

}  // namespace vidmcp::download

#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <thread>
#include "core/config/unique_id.hpp"
#include "core/errors/server_errors.hpp"
#include "download/extractor.hpp"

namespace vidmcp::testing {

class TempWorkspace {
public:
    explicit TempWorkspace(const std::string& tag) {
        root_ = std::filesystem::current_path() /
                (".tmp_" + tag + "_" + core::config::generate_unique_id(""));
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

inline bool directory_is_empty(const std::filesystem::path& dir) {
    std::error_code ec;
    return std::filesystem::is_empty(dir, ec) && !ec;
}

// In-process stand-in for yt-dlp. Behaviour is picked by markers in the URL:
//   "fail"    extraction error
//   "slow"    sleeps before producing the file
//   "renamed" predicts "<title>.webm" but writes "<title>.mp3"
//   "nofile"  reports success without writing anything
// Anything else writes "<title>.mp4" with kVideoBytes and reports two
// downloading events plus a finished event.
class FakeExtractor : public download::Extractor {
public:
    static constexpr const char* kVideoBytes = "fake-video-bytes";

    core::errors::Result<download::ExtractionInfo> extract(
        const download::ExtractionRequest& request,
        const download::ProgressCallback& on_progress) override {
        ++calls_;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_format_ = request.format_constraint;
        }
        const auto& url = request.url;

        if (url.find("fail") != std::string::npos) {
            on_progress(protocol::ErrorEvent{"Video unavailable"});
            return core::errors::ServerError{core::errors::ErrorCategory::Extraction,
                                             "yt-dlp download error: Video unavailable",
                                             "extractor_failed"};
        }
        if (url.find("slow") != std::string::npos) {
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
        }

        const std::string title = "Clip " + url.substr(url.find_last_of('/') + 1);
        const auto predicted = request.output_directory / (title + ".mp4");

        on_progress(protocol::DownloadingEvent{" 10.0%", "1.00MiB/s", predicted.string()});
        on_progress(protocol::DownloadingEvent{" 90.0%", "2.00MiB/s", predicted.string()});
        on_progress(protocol::FinishedEvent{predicted.string()});

        download::ExtractionInfo info;
        info.title = title;
        info.uploader = "Fake Uploader";
        info.duration_seconds = 150.0;
        info.view_count = 1234567;

        if (url.find("nofile") != std::string::npos) {
            info.downloaded_file = predicted;
            return info;
        }
        if (url.find("renamed") != std::string::npos) {
            std::ofstream(request.output_directory / (title + ".mp3"), std::ios::binary)
                << kVideoBytes;
            info.downloaded_file = request.output_directory / (title + ".webm");
            return info;
        }

        std::ofstream(predicted, std::ios::binary) << kVideoBytes;
        info.downloaded_file = predicted;
        return info;
    }

    int calls() const { return calls_.load(); }
    std::string last_format() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_format_;
    }

private:
    std::atomic<int> calls_{0};
    mutable std::mutex mutex_;
    std::string last_format_;
};

// Writes an executable shell script that answers like yt-dlp run with the
// progress and result templates. URL markers: "fail" prints an ERROR line and
// exits 1, "noresult" skips the result line, "slow" sleeps for 5 seconds.
inline std::filesystem::path write_fake_ytdlp(const std::filesystem::path& dir) {
    const auto script = dir / "fake-yt-dlp";
    std::ofstream out(script);
    out << "#!/bin/sh\n"
           "for last; do :; done\n"
           "case \"$last\" in\n"
           "  *fail*) echo 'ERROR: [generic] Unsupported URL' >&2; exit 1 ;;\n"
           "  *slow*) exec sleep 5 ;;\n"
           "esac\n"
           "file=\"$PWD/Test Clip.mp4\"\n"
           "echo \"[vidmcp-progress] downloading|  10.0%|500.00KiB/s|$file\" >&2\n"
           "echo \"[vidmcp-progress] downloading| 100.0%|1.20MiB/s|$file\"\n"
           "printf 'fake-video-bytes' > \"$file\"\n"
           "echo \"[vidmcp-progress] finished|100%||$file\"\n"
           "case \"$last\" in\n"
           "  *noresult*) exit 0 ;;\n"
           "esac\n"
           "echo \"[vidmcp-result] {\\\"title\\\": \\\"Test Clip\\\", \\\"uploader\\\": "
           "\\\"Script\\\", \\\"duration\\\": 61.5, \\\"view_count\\\": 42, "
           "\\\"filepath\\\": \\\"$file\\\"}\"\n";
    out.close();
    std::filesystem::permissions(script,
                                 std::filesystem::perms::owner_all |
                                     std::filesystem::perms::group_read |
                                     std::filesystem::perms::group_exec);
    return script;
}

}  // namespace vidmcp::testing

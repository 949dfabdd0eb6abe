#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>
#include "protocol/event_contract.hpp"

namespace vidmcp::protocol {

enum class Quality {
    Best,
    Worst,
    P720,
    P480,
    P360
};

struct DownloadOptions {
    std::string url;
    Quality quality = Quality::P720;
    bool audio_only = false;
};

// Artifact left in the shared directory; payload is its location.
struct FileRef {
    std::string path;
};

// Artifact bytes, base64-encoded.
struct InlineBytes {
    std::string base64;
};

using Payload = std::variant<FileRef, InlineBytes>;

struct DownloadSuccess {
    std::string title;
    std::string uploader;
    double duration_seconds = 0.0;
    std::int64_t view_count = 0;
    std::string file_name;
    std::uintmax_t file_size_bytes = 0;
    std::string mime_type;
    std::vector<std::string> progress_log;
    Payload payload;
};

struct DownloadFailure {
    std::string message;
};

using DownloadResult = std::variant<DownloadSuccess, DownloadFailure>;

enum class DownloadState {
    Idle,
    Resolving,
    Downloading,
    Finished,
    Encoding,
    Done,
    Failed
};

inline bool is_terminal(const DownloadState state) {
    return state == DownloadState::Done || state == DownloadState::Failed;
}

inline std::string to_string(const Quality quality) {
    switch (quality) {
        case Quality::Best:
            return "best";
        case Quality::Worst:
            return "worst";
        case Quality::P720:
            return "720p";
        case Quality::P480:
            return "480p";
        case Quality::P360:
            return "360p";
        default:
            return "unknown";
    }
}

inline std::string to_string(const DownloadState state) {
    switch (state) {
        case DownloadState::Idle:
            return "idle";
        case DownloadState::Resolving:
            return "resolving";
        case DownloadState::Downloading:
            return "downloading";
        case DownloadState::Finished:
            return "finished";
        case DownloadState::Encoding:
            return "encoding";
        case DownloadState::Done:
            return "done";
        case DownloadState::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

}  // namespace vidmcp::protocol

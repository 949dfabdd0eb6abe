#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include "core/logging/logger.hpp"

namespace vidmcp::core::config {

    enum class PayloadMode {
        Inline,   // base64 block inside the response text
        FileRef   // artifact left in the shared directory
    };

    // Validated settings the server is started with. Every component receives
    // the fields it needs through its constructor.
    struct ServerConfig {
        PayloadMode payload_mode = PayloadMode::Inline;
        std::filesystem::path shared_dir = "/downloads";
        std::filesystem::path scratch_root = std::filesystem::temp_directory_path();
        std::string extractor_binary = "yt-dlp";
        std::uint32_t extractor_timeout_ms = 0;   // 0 = no deadline
        std::size_t worker_threads = 4;
        std::uintmax_t max_inline_bytes = 0;      // 0 = unlimited
        logging::LogLevel log_level = logging::LogLevel::INFO;
    };

    inline std::string to_string(const PayloadMode mode) {
        switch (mode) {
            case PayloadMode::Inline:
                return "inline";
            case PayloadMode::FileRef:
                return "file";
            default:
                return "unknown";
        }
    }

} // namespace vidmcp::core::config

#include "cli_parser.hpp"
#include <charconv>
#include <cstdlib>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace vidmcp::app::cli {

    using namespace vidmcp::core::errors;
    using vidmcp::core::config::PayloadMode;
    using vidmcp::core::config::ServerConfig;
    using vidmcp::core::logging::LogLevel;

    namespace {

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> payload_mode;
        std::optional<std::string> shared_dir;
        std::optional<std::string> scratch_root;
        std::optional<std::string> extractor;
        std::optional<std::string> timeout_ms;
        std::optional<std::string> workers;
        std::optional<std::string> max_inline_bytes;
        std::optional<std::string> log_level;
    };

    void read_env(const char* name, std::optional<std::string>& slot) {
        const char* value = std::getenv(name);
        if (value != nullptr && value[0] != '\0') {
            slot = std::string(value);
        }
    }

    // Exception-free integer parsing
    template <typename T>
    std::optional<T> parse_unsigned(const std::string& text) {
        T value = 0;
        const char* begin = text.data();
        const char* end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(begin, end, value);
        if (ec != std::errc() || ptr != end || text.empty()) {
            return std::nullopt;
        }
        return value;
    }

    std::optional<LogLevel> parse_log_level(const std::string& text) {
        if (text == "debug") return LogLevel::DEBUG;
        if (text == "info") return LogLevel::INFO;
        if (text == "warn") return LogLevel::WARN;
        if (text == "error") return LogLevel::ERROR;
        return std::nullopt;
    }

    }  // namespace

    Result<ServerConfig> parse_and_validate(int argc, char* argv[]) {
        RawCliOptions raw;
        read_env("VIDMCP_PAYLOAD_MODE", raw.payload_mode);
        read_env("VIDMCP_SHARED_DIR", raw.shared_dir);
        read_env("VIDMCP_SCRATCH_ROOT", raw.scratch_root);
        read_env("VIDMCP_EXTRACTOR", raw.extractor);
        read_env("VIDMCP_TIMEOUT_MS", raw.timeout_ms);
        read_env("VIDMCP_WORKERS", raw.workers);
        read_env("VIDMCP_MAX_INLINE_BYTES", raw.max_inline_bytes);
        read_env("VIDMCP_LOG_LEVEL", raw.log_level);

        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        std::size_t first = 0;
        if (!args.empty() && args[0].rfind("--", 0) != 0) {
            if (args[0] != "serve") {
                return ServerError{ErrorCategory::Input, "Unknown command: " + args[0], "unknown_command", "Currently only the 'serve' command is supported."};
            }
            first = 1;
        }

        // 2. Parser Phase: Just read the raw strings
        auto take = [&args](std::size_t& i, std::optional<std::string>& slot) -> bool {
            if (i + 1 >= args.size()) {
                return false;
            }
            slot = args[++i];
            return true;
        };

        for (std::size_t i = first; i < args.size(); ++i) {
            const std::string& flag = args[i];
            bool ok = true;
            if (flag == "--payload-mode") {
                ok = take(i, raw.payload_mode);
            } else if (flag == "--shared-dir") {
                ok = take(i, raw.shared_dir);
            } else if (flag == "--scratch-root") {
                ok = take(i, raw.scratch_root);
            } else if (flag == "--extractor") {
                ok = take(i, raw.extractor);
            } else if (flag == "--timeout-ms") {
                ok = take(i, raw.timeout_ms);
            } else if (flag == "--workers") {
                ok = take(i, raw.workers);
            } else if (flag == "--max-inline-bytes") {
                ok = take(i, raw.max_inline_bytes);
            } else if (flag == "--log-level") {
                ok = take(i, raw.log_level);
            } else {
                return ServerError{ErrorCategory::Input, "Unknown argument: " + flag, "unknown_argument"};
            }
            if (!ok) {
                return ServerError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        ServerConfig config;

        if (raw.payload_mode) {
            if (*raw.payload_mode == "inline") {
                config.payload_mode = PayloadMode::Inline;
            } else if (*raw.payload_mode == "file") {
                config.payload_mode = PayloadMode::FileRef;
            } else {
                return ServerError{ErrorCategory::Input, "Invalid payload mode: " + *raw.payload_mode, "invalid_payload_mode", "Use 'inline' or 'file'."};
            }
        }

        if (raw.shared_dir) {
            if (raw.shared_dir->empty()) {
                return ServerError{ErrorCategory::Input, "Shared directory cannot be empty", "invalid_path"};
            }
            config.shared_dir = *raw.shared_dir;
        }

        if (raw.scratch_root) {
            std::filesystem::path p(raw.scratch_root.value());
            std::error_code path_ec;
            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (path_ec || !is_dir) {
                return ServerError{ErrorCategory::Input, "Scratch root does not exist or is not a directory", "invalid_path"};
            }
            config.scratch_root = std::move(p);
        }

        if (raw.extractor) {
            if (raw.extractor->empty()) {
                return ServerError{ErrorCategory::Input, "Extractor binary cannot be empty", "missing_value"};
            }
            config.extractor_binary = *raw.extractor;
        }

        if (raw.timeout_ms) {
            const auto timeout = parse_unsigned<std::uint32_t>(*raw.timeout_ms);
            if (!timeout) {
                return ServerError{ErrorCategory::Input, "Invalid number for --timeout-ms", "invalid_integer", "Provide a non-negative integer."};
            }
            config.extractor_timeout_ms = *timeout;
        }

        if (raw.workers) {
            const auto workers = parse_unsigned<std::size_t>(*raw.workers);
            if (!workers) {
                return ServerError{ErrorCategory::Input, "Invalid number for --workers", "invalid_integer", "Provide a positive integer."};
            }
            if (*workers == 0 || *workers > 64) {
                return ServerError{ErrorCategory::Input, "--workers out of bounds", "bounds_error", "Must be between 1 and 64."};
            }
            config.worker_threads = *workers;
        }

        if (raw.max_inline_bytes) {
            const auto cap = parse_unsigned<std::uintmax_t>(*raw.max_inline_bytes);
            if (!cap) {
                return ServerError{ErrorCategory::Input, "Invalid number for --max-inline-bytes", "invalid_integer", "Provide a non-negative integer."};
            }
            config.max_inline_bytes = *cap;
        }

        if (raw.log_level) {
            const auto level = parse_log_level(*raw.log_level);
            if (!level) {
                return ServerError{ErrorCategory::Input, "Invalid log level: " + *raw.log_level, "invalid_log_level", "Use debug, info, warn or error."};
            }
            config.log_level = *level;
        }

        return config;
    }

} // namespace vidmcp::app::cli

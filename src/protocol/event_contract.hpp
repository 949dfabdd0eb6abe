#pragma once
#include <string>
#include <type_traits>
#include <variant>

namespace vidmcp::protocol {

    // Progress reported by the extraction capability while one download runs.
    struct DownloadingEvent {
        std::string percent;   // e.g. " 42.0%", as reported
        std::string speed;     // e.g. "1.20MiB/s"
        std::string filename;
    };
    struct FinishedEvent { std::string filename; };
    struct ErrorEvent { std::string message; };

    using ProgressEvent = std::variant<
        DownloadingEvent,
        FinishedEvent,
        ErrorEvent
    >;

    inline std::string trim_field(const std::string& value) {
        const auto first = value.find_first_not_of(' ');
        if (first == std::string::npos) {
            return "";
        }
        const auto last = value.find_last_not_of(' ');
        return value.substr(first, last - first + 1);
    }

    inline std::string base_name(const std::string& path) {
        const auto slash = path.find_last_of('/');
        return slash == std::string::npos ? path : path.substr(slash + 1);
    }

    // Single human-readable progress log line for an event.
    inline std::string describe(const ProgressEvent& event) {
        return std::visit(
            [](const auto& e) -> std::string {
                using T = std::decay_t<decltype(e)>;
                if constexpr (std::is_same_v<T, DownloadingEvent>) {
                    const std::string percent = trim_field(e.percent);
                    const std::string speed = trim_field(e.speed);
                    return "Downloading " + base_name(e.filename) + ": " +
                           (percent.empty() ? "N/A" : percent) + " at " +
                           (speed.empty() ? "N/A" : speed);
                } else if constexpr (std::is_same_v<T, FinishedEvent>) {
                    return "Download completed: " + base_name(e.filename);
                } else {
                    static_assert(std::is_same_v<T, ErrorEvent>,
                                  "unhandled progress event");
                    return "Download error: " +
                           (e.message.empty() ? std::string("Unknown error") : e.message);
                }
            },
            event);
    }

} // namespace vidmcp::protocol

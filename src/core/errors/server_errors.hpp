#pragma once
#include <string>
#include <utility>
#include <variant>

namespace vidmcp::core::errors {

    // 1. Define typed error categories
    enum class ErrorCategory {
        Input,       // E.g., bad CLI flag or malformed tool arguments
        Protocol,    // E.g., JSON-RPC framing or method errors
        Tool,        // E.g., unknown tool name
        Extraction,  // E.g., yt-dlp refused or failed the download
        Resource,    // E.g., scratch directory not writable
        Policy,      // E.g., URL with a disallowed scheme
        Internal     // E.g., C++ logic bug or I/O failure
    };

    // The standardized error payload
    struct ServerError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the operator
        };

    // 2. Define the Propagation Strategy (Result Object)
    // A Result will hold either a successful value of type T, OR a ServerError.
    template <typename T>
    using Result = std::variant<T, ServerError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<ServerError>(result);
    }

    template <typename T>
    const ServerError& get_error(const Result<T>& result) {
        return std::get<ServerError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    // Moves the value out, for move-only types such as scratch directories.
    template <typename T>
    T take_value(Result<T>&& result) {
        return std::get<T>(std::move(result));
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:      return "input";
            case ErrorCategory::Protocol:   return "protocol";
            case ErrorCategory::Tool:       return "tool";
            case ErrorCategory::Extraction: return "extraction";
            case ErrorCategory::Resource:   return "resource";
            case ErrorCategory::Policy:     return "policy";
            case ErrorCategory::Internal:   return "internal";
            default: return "unknown";
        }
    }

} // namespace vidmcp::core::errors

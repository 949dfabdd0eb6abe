#pragma once
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace vidmcp::protocol {

    // JSON-RPC 2.0 error codes used on the wire.
    namespace error_codes {
        constexpr int kParseError = -32700;
        constexpr int kInvalidRequest = -32600;
        constexpr int kMethodNotFound = -32601;
        constexpr int kInvalidParams = -32602;
        constexpr int kInternalError = -32603;
    }

    // A call that expects exactly one Response carrying the same id.
    // The id is kept as raw JSON so string and integer ids echo back verbatim.
    struct Request {
        nlohmann::json id;
        std::string method;
        nlohmann::json params = nlohmann::json::object();
    };

    // Fire-and-forget: no id, never answered.
    struct Notification {
        std::string method;
        nlohmann::json params = nlohmann::json::object();
    };

    struct ResponseError {
        int code = error_codes::kInternalError;
        std::string message;
    };

    // Exactly one of result / error is set.
    struct Response {
        nlohmann::json id;
        std::optional<nlohmann::json> result;
        std::optional<ResponseError> error;
    };

    using Message = std::variant<Request, Notification, Response>;

} // namespace vidmcp::protocol

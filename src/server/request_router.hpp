#pragma once

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "core/errors/server_errors.hpp"
#include "protocol/message_contract.hpp"

namespace vidmcp::server {

// A request handler returns the "result" member or a ServerError that is
// mapped onto a JSON-RPC error object.
using MethodHandler =
    std::function<core::errors::Result<nlohmann::json>(const nlohmann::json& params)>;
using NotificationHandler = std::function<void(const nlohmann::json& params)>;

// Maps method names to handlers. Registration must finish before dispatching
// starts; dispatch itself is const and safe to call from several workers.
class RequestRouter {
public:
    void register_method(const std::string& method, MethodHandler handler);
    void register_notification(const std::string& method, NotificationHandler handler);

    bool has_method(const std::string& method) const;

    // Requests always yield a Response; notifications and stray responses
    // never do. Handler exceptions are converted, never rethrown.
    std::optional<protocol::Response> dispatch(const protocol::Message& message) const;

    // Parses then dispatches. Unparseable lines yield an error Response only
    // when their id can be recovered.
    std::optional<protocol::Response> dispatch_line(const std::string& line) const;

private:
    protocol::Response dispatch_request(const protocol::Request& request) const;
    void dispatch_notification(const protocol::Notification& notification) const;

    std::unordered_map<std::string, MethodHandler> methods_;
    std::unordered_map<std::string, NotificationHandler> notifications_;
};

// Error Response for a line that failed protocol::parse_message, if the id
// can be recovered from it.
std::optional<protocol::Response> make_parse_failure_response(
    const std::string& line, const core::errors::ServerError& error);

}  // namespace vidmcp::server

#include "server/request_router.hpp"

#include <exception>
#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/jsonrpc_codec.hpp"

namespace vidmcp::server {

using protocol::Message;
using protocol::Notification;
using protocol::Request;
using protocol::Response;

void RequestRouter::register_method(const std::string& method,
                                    MethodHandler handler) {
    methods_[method] = std::move(handler);
}

void RequestRouter::register_notification(const std::string& method,
                                          NotificationHandler handler) {
    notifications_[method] = std::move(handler);
}

bool RequestRouter::has_method(const std::string& method) const {
    return methods_.find(method) != methods_.end();
}

std::optional<Response> RequestRouter::dispatch(const Message& message) const {
    if (const auto* request = std::get_if<Request>(&message)) {
        return dispatch_request(*request);
    }
    if (const auto* notification = std::get_if<Notification>(&message)) {
        dispatch_notification(*notification);
        return std::nullopt;
    }
    // This server never issues requests, so no response is expected.
    LOG_WARN("RequestRouter: ignoring unsolicited response message");
    return std::nullopt;
}

std::optional<Response> RequestRouter::dispatch_line(const std::string& line) const {
    auto parsed = protocol::parse_message(line);
    if (core::errors::is_error(parsed)) {
        return make_parse_failure_response(line, core::errors::get_error(parsed));
    }
    return dispatch(core::errors::get_value(parsed));
}

Response RequestRouter::dispatch_request(const Request& request) const {
    const auto it = methods_.find(request.method);
    if (it == methods_.end()) {
        LOG_WARN("RequestRouter: method not found: " + request.method);
        return protocol::make_error(request.id,
                                    protocol::error_codes::kMethodNotFound,
                                    "Method not found: " + request.method);
    }

    try {
        auto result = it->second(request.params);
        if (core::errors::is_error(result)) {
            const auto& err = core::errors::get_error(result);
            LOG_WARN("RequestRouter: " + request.method + " failed [" + err.code +
                     "]: " + err.message);
            return protocol::make_error(request.id, protocol::error_code_for(err),
                                        err.message);
        }
        return protocol::make_result(request.id, core::errors::get_value(result));
    } catch (const std::exception& e) {
        LOG_ERROR("RequestRouter: handler for " + request.method +
                  " threw: " + e.what());
        return protocol::make_error(request.id,
                                    protocol::error_codes::kInternalError,
                                    std::string("Internal error: ") + e.what());
    }
}

void RequestRouter::dispatch_notification(const Notification& notification) const {
    const auto it = notifications_.find(notification.method);
    if (it == notifications_.end()) {
        LOG_DEBUG("RequestRouter: no handler for notification " +
                  notification.method);
        return;
    }
    try {
        it->second(notification.params);
    } catch (const std::exception& e) {
        LOG_ERROR("RequestRouter: notification handler for " +
                  notification.method + " threw: " + e.what());
    }
}

std::optional<Response> make_parse_failure_response(
    const std::string& line, const core::errors::ServerError& error) {
    const auto id = protocol::recover_request_id(line);
    if (!id.has_value()) {
        LOG_WARN("RequestRouter: dropping unparseable line [" + error.code +
                 "]: " + error.message);
        return std::nullopt;
    }
    return protocol::make_error(*id, protocol::error_code_for(error), error.message);
}

}  // namespace vidmcp::server

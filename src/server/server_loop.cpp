#include "server/server_loop.hpp"

#include <utility>
#include <variant>
#include "core/logging/logger.hpp"
#include "protocol/jsonrpc_codec.hpp"

namespace vidmcp::server {

using protocol::Request;
using protocol::Response;

ServerLoop::ServerLoop(transport::FramedChannel& channel, const RequestRouter& router,
                       runtime::WorkerPool& pool)
    : channel_(channel), router_(router), pool_(pool) {}

void ServerLoop::offload_method(const std::string& method) {
    offloaded_.insert(method);
}

const session::RequestTracker& ServerLoop::tracker() const {
    return tracker_;
}

std::size_t ServerLoop::run() {
    LOG_INFO("ServerLoop: waiting for messages");
    std::size_t lines = 0;
    while (auto line = channel_.read_message()) {
        ++lines;
        handle_line(*line);
    }

    LOG_INFO("ServerLoop: input closed, draining " +
             std::to_string(tracker_.in_flight()) + " in-flight request(s)");
    pool_.wait_idle();
    LOG_INFO("ServerLoop: stopped after " + std::to_string(lines) + " message(s)");
    return lines;
}

void ServerLoop::handle_line(const std::string& line) {
    auto parsed = protocol::parse_message(line);
    if (core::errors::is_error(parsed)) {
        if (auto response = make_parse_failure_response(line, core::errors::get_error(parsed))) {
            send(*response);
        }
        return;
    }

    auto message = core::errors::take_value(std::move(parsed));
    if (auto* request = std::get_if<Request>(&message)) {
        handle_request(std::move(*request));
        return;
    }
    // Notifications and stray responses never produce output.
    router_.dispatch(message);
}

void ServerLoop::handle_request(Request request) {
    auto begun = tracker_.begin(request.id, request.method);
    if (core::errors::is_error(begun)) {
        LOG_WARN("ServerLoop: dropping " + request.method + ": " +
                 core::errors::get_error(begun).message);
        return;
    }

    if (offloaded_.count(request.method) == 0) {
        answer(request);
        return;
    }

    const std::string method = request.method;
    const auto id = request.id;
    const bool queued = pool_.submit([this, request = std::move(request)]() {
        answer(request);
    });
    if (!queued) {
        LOG_ERROR("ServerLoop: worker pool stopped, rejecting " + method);
        auto completed = tracker_.complete(id);
        if (core::errors::is_error(completed)) {
            LOG_WARN("ServerLoop: " + core::errors::get_error(completed).message);
        }
        send(protocol::make_error(id, protocol::error_codes::kInternalError,
                                  "Internal error: server is shutting down"));
    }
}

void ServerLoop::answer(const Request& request) {
    auto response = router_.dispatch(request);
    // Released before writing so a client may reuse the id as soon as it
    // sees the response.
    auto completed = tracker_.complete(request.id);
    if (core::errors::is_error(completed)) {
        LOG_WARN("ServerLoop: " + core::errors::get_error(completed).message);
    }
    if (response.has_value()) {
        send(*response);
    }
}

void ServerLoop::send(const Response& response) {
    auto written = channel_.write_message(protocol::serialize(response));
    if (core::errors::is_error(written)) {
        const auto& err = core::errors::get_error(written);
        LOG_ERROR("ServerLoop: failed to write response [" + err.code + "]: " +
                  err.message);
    }
}

}  // namespace vidmcp::server

#pragma once

#include <cstddef>
#include <string>
#include <unordered_set>
#include "protocol/message_contract.hpp"
#include "runtime/worker_pool.hpp"
#include "server/request_router.hpp"
#include "session/request_tracker.hpp"
#include "transport/framed_channel.hpp"

namespace vidmcp::server {

// Reads framed messages until end of input and answers each request exactly
// once.
//
// Methods marked with offload_method() run on the worker pool, everything
// else is answered on the reading thread, so a long tools/call never blocks
// tools/list or ping. Responses are written as they complete, in any order.
class ServerLoop {
public:
    ServerLoop(transport::FramedChannel& channel, const RequestRouter& router,
               runtime::WorkerPool& pool);

    ServerLoop(const ServerLoop&) = delete;
    ServerLoop& operator=(const ServerLoop&) = delete;

    void offload_method(const std::string& method);

    // Returns after end of input once every accepted request has been
    // answered. Returns the number of lines read.
    std::size_t run();

    const session::RequestTracker& tracker() const;

private:
    void handle_line(const std::string& line);
    void handle_request(protocol::Request request);
    void answer(const protocol::Request& request);
    void send(const protocol::Response& response);

    transport::FramedChannel& channel_;
    const RequestRouter& router_;
    runtime::WorkerPool& pool_;
    session::RequestTracker tracker_;
    std::unordered_set<std::string> offloaded_;
};

}  // namespace vidmcp::server

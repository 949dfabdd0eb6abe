#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "core/errors/server_errors.hpp"

namespace vidmcp::session {

struct RequestRecord {
    std::string key;
    std::string method;
};

// Ids of requests that have been accepted but not yet answered.
//
// Ids are keyed by their JSON text, so the string "1" and the integer 1 are
// different requests. An id may be reused once its response has been written.
class RequestTracker {
public:
    // Fails with "duplicate_request_id" while the same id is still in flight.
    core::errors::Result<std::size_t> begin(const nlohmann::json& id,
                                            const std::string& method);

    // Fails with "request_not_found" if the id is not in flight.
    core::errors::Result<std::size_t> complete(const nlohmann::json& id);

    bool is_in_flight(const nlohmann::json& id) const;
    std::size_t in_flight() const;

private:
    static std::string key_for(const nlohmann::json& id);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, RequestRecord> requests_;
};

}  // namespace vidmcp::session

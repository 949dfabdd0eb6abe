#include "session/request_tracker.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace vidmcp::session {

using core::errors::ErrorCategory;
using core::errors::ServerError;

std::string RequestTracker::key_for(const nlohmann::json& id) {
    return id.dump();
}

core::errors::Result<std::size_t> RequestTracker::begin(const nlohmann::json& id,
                                                        const std::string& method) {
    const std::string key = key_for(id);
    std::lock_guard<std::mutex> lock(mutex_);
    if (requests_.find(key) != requests_.end()) {
        return ServerError{ErrorCategory::Protocol,
                           "Request id already in flight: " + key,
                           "duplicate_request_id"};
    }

    RequestRecord record;
    record.key = key;
    record.method = method;
    requests_.emplace(key, std::move(record));
    LOG_DEBUG("RequestTracker: " + key + " (" + method + ") in flight");
    return requests_.size();
}

core::errors::Result<std::size_t> RequestTracker::complete(const nlohmann::json& id) {
    const std::string key = key_for(id);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(key);
    if (it == requests_.end()) {
        return ServerError{ErrorCategory::Internal, "Request id not in flight: " + key,
                           "request_not_found"};
    }
    LOG_DEBUG("RequestTracker: " + key + " (" + it->second.method + ") answered");
    requests_.erase(it);
    return requests_.size();
}

bool RequestTracker::is_in_flight(const nlohmann::json& id) const {
    const std::string key = key_for(id);
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.find(key) != requests_.end();
}

std::size_t RequestTracker::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
}

}  // namespace vidmcp::session

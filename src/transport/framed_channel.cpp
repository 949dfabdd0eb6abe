#include "transport/framed_channel.hpp"

#include "core/logging/logger.hpp"

namespace vidmcp::transport {

using core::errors::ErrorCategory;
using core::errors::ServerError;

FramedChannel::FramedChannel(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {}

std::optional<std::string> FramedChannel::read_message() {
    std::string line;
    while (std::getline(in_, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }
        return line;
    }
    return std::nullopt;
}

core::errors::Result<std::size_t> FramedChannel::write_message(
    const std::string& payload) {
    if (payload.find('\n') != std::string::npos ||
        payload.find('\r') != std::string::npos) {
        return ServerError{ErrorCategory::Protocol,
                           "Framed message must not contain line breaks.",
                           "invalid_frame"};
    }

    std::string frame;
    frame.reserve(payload.size() + 1);
    frame.append(payload);
    frame.push_back('\n');

    std::lock_guard<std::mutex> lock(write_mutex_);
    out_.write(frame.data(), static_cast<std::streamsize>(frame.size()));
    out_.flush();
    if (!out_.good()) {
        LOG_ERROR("FramedChannel: output stream failed after " +
                  std::to_string(messages_written_) + " messages");
        return ServerError{ErrorCategory::Internal,
                           "Failed to write message to output stream.",
                           "channel_write_failed"};
    }
    ++messages_written_;
    return frame.size();
}

std::size_t FramedChannel::messages_written() const {
    std::lock_guard<std::mutex> lock(write_mutex_);
    return messages_written_;
}

}  // namespace vidmcp::transport

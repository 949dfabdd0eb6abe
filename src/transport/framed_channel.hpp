#pragma once

#include <cstddef>
#include <istream>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include "core/errors/server_errors.hpp"

namespace vidmcp::transport {

// Newline-delimited message framing over a pair of streams.
//
// Reading happens on the server loop thread only. Writing may happen from any
// worker; each message is assembled in full and written plus flushed under a
// single lock, so lines never interleave. Nothing but message lines may ever
// be written to the output stream.
class FramedChannel {
public:
    FramedChannel(std::istream& in, std::ostream& out);

    FramedChannel(const FramedChannel&) = delete;
    FramedChannel& operator=(const FramedChannel&) = delete;

    // Next non-blank line without its terminator, or nullopt at end of stream.
    std::optional<std::string> read_message();

    // Writes payload + '\n' and flushes. Returns the number of bytes written.
    core::errors::Result<std::size_t> write_message(const std::string& payload);

    std::size_t messages_written() const;

private:
    std::istream& in_;
    std::ostream& out_;
    mutable std::mutex write_mutex_;
    std::size_t messages_written_ = 0;
};

}  // namespace vidmcp::transport

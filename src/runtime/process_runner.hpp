#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "core/errors/server_errors.hpp"

namespace vidmcp::runtime {

using LineCallback = std::function<void(const std::string& line)>;

struct ProcessRequest {
    std::vector<std::string> argv;   // argv[0] is looked up on PATH
    std::filesystem::path working_directory = ".";
    std::uint32_t timeout_ms = 0;    // 0 = no deadline
    std::shared_ptr<std::atomic_bool> cancel_token;
};

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

// Runs a child process with stdin on /dev/null and both output streams piped
// back, so nothing the child prints can reach this process's own stdout.
// Complete lines are handed to the callbacks as they arrive, on the calling
// thread; the full text is still kept in the capture.
core::errors::Result<ProcessCapture> run_process(const ProcessRequest& request,
                                                 const LineCallback& on_stdout_line = {},
                                                 const LineCallback& on_stderr_line = {});

}  // namespace vidmcp::runtime

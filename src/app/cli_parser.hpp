#pragma once
#include "core/config/server_config.hpp"
#include "core/errors/server_errors.hpp"

namespace vidmcp::app::cli {
    // Defaults, then VIDMCP_* environment variables, then command-line flags.
    vidmcp::core::errors::Result<vidmcp::core::config::ServerConfig> parse_and_validate(int argc, char* argv[]);
}

#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/server_errors.hpp"
#include "server/request_router.hpp"
#include "tools/tool_registry.hpp"

namespace vidmcp::server {

struct ServerInfo {
    std::string name = "vidmcp";
    std::string version = "0.1.0";
    std::string protocol_version = "2024-11-05";
};

core::errors::Result<nlohmann::json> handle_initialize(const ServerInfo& info,
                                                       const nlohmann::json& params);

core::errors::Result<nlohmann::json> handle_tools_list(const tools::ToolRegistry& registry,
                                                       const nlohmann::json& params);

// Tool failures are reported in the result with isError set; only a missing
// or malformed "name" is a protocol error (-32602).
core::errors::Result<nlohmann::json> handle_tools_call(const tools::ToolRegistry& registry,
                                                       const nlohmann::json& params);

// Registers initialize, ping, tools/list, tools/call and the
// notifications/initialized notification. The registry must outlive the router.
void register_mcp_methods(RequestRouter& router, const tools::ToolRegistry& registry,
                          const ServerInfo& info = {});

}  // namespace vidmcp::server

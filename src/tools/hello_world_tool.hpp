#pragma once

#include <cstddef>
#include <nlohmann/json.hpp>
#include "core/errors/server_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/tool_registry.hpp"

namespace vidmcp::tools {

inline constexpr const char* kHelloWorldTool = "hello-world";

protocol::ToolDescriptor hello_world_descriptor();

// "<greeting> World!", with "Hello" when greeting is absent or not a string.
protocol::ToolResult hello_world(const nlohmann::json& arguments);

core::errors::Result<std::size_t> register_hello_world(ToolRegistry& registry);

}  // namespace vidmcp::tools

#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/server_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace vidmcp::tools {

using ToolHandler = std::function<protocol::ToolResult(const nlohmann::json& arguments)>;

class ToolRegistry {
public:
    // Rejects empty and duplicate names. Returns the number of registered tools.
    core::errors::Result<std::size_t> register_tool(protocol::ToolDescriptor descriptor,
                                                    ToolHandler handler);

    // Registration order, stable for the life of the registry.
    const std::vector<protocol::ToolDescriptor>& list_tools() const;
    nlohmann::json list_tools_json() const;

    bool has_tool(const std::string& name) const;

    // Unknown names and handler exceptions become error content, never throw.
    protocol::ToolResult invoke(const std::string& name,
                                const nlohmann::json& arguments) const;

private:
    std::string available_names() const;

    std::vector<protocol::ToolDescriptor> descriptors_;
    std::unordered_map<std::string, ToolHandler> handlers_;
};

}  // namespace vidmcp::tools

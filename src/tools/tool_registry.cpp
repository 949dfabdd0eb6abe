#include "tools/tool_registry.hpp"

#include <exception>
#include <utility>
#include "core/logging/logger.hpp"

namespace vidmcp::tools {

using core::errors::ErrorCategory;
using core::errors::ServerError;

core::errors::Result<std::size_t> ToolRegistry::register_tool(
    protocol::ToolDescriptor descriptor, ToolHandler handler) {
    if (descriptor.name.empty()) {
        return ServerError{ErrorCategory::Tool, "Tool name cannot be empty.",
                           "invalid_tool_name"};
    }
    if (!handler) {
        return ServerError{ErrorCategory::Tool,
                           "Tool handler missing for: " + descriptor.name,
                           "missing_tool_handler"};
    }
    if (handlers_.find(descriptor.name) != handlers_.end()) {
        return ServerError{ErrorCategory::Tool,
                           "Tool already registered: " + descriptor.name,
                           "duplicate_tool"};
    }

    LOG_DEBUG("ToolRegistry: registered " + descriptor.name);
    handlers_.emplace(descriptor.name, std::move(handler));
    descriptors_.push_back(std::move(descriptor));
    return descriptors_.size();
}

const std::vector<protocol::ToolDescriptor>& ToolRegistry::list_tools() const {
    return descriptors_;
}

nlohmann::json ToolRegistry::list_tools_json() const {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& descriptor : descriptors_) {
        tools.push_back(protocol::to_json(descriptor));
    }
    return tools;
}

bool ToolRegistry::has_tool(const std::string& name) const {
    return handlers_.find(name) != handlers_.end();
}

std::string ToolRegistry::available_names() const {
    std::string names;
    for (const auto& descriptor : descriptors_) {
        if (!names.empty()) {
            names += ", ";
        }
        names += descriptor.name;
    }
    return names;
}

protocol::ToolResult ToolRegistry::invoke(const std::string& name,
                                          const nlohmann::json& arguments) const {
    const auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        LOG_WARN("ToolRegistry: unknown tool " + name);
        return protocol::text_result(
            "Unknown tool: " + name + ". Available tools: " + available_names(), true);
    }

    try {
        return it->second(arguments);
    } catch (const std::exception& e) {
        LOG_ERROR("ToolRegistry: tool " + name + " threw: " + e.what());
        return protocol::text_result(std::string("Unexpected error: ") + e.what() +
                                         ". Please check the arguments and try again.",
                                     true);
    } catch (...) {
        LOG_ERROR("ToolRegistry: tool " + name + " threw a non-standard exception");
        return protocol::text_result(
            "Unexpected error: tool " + name + " failed. Please check the arguments "
            "and try again.",
            true);
    }
}

}  // namespace vidmcp::tools

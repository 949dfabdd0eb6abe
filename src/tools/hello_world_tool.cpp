#include "tools/hello_world_tool.hpp"

#include <string>

namespace vidmcp::tools {

using nlohmann::json;

protocol::ToolDescriptor hello_world_descriptor() {
    protocol::ToolDescriptor descriptor;
    descriptor.name = kHelloWorldTool;
    descriptor.description = "A simple hello world tool";
    descriptor.input_schema = json{
        {"type", "object"},
        {"properties",
         {{"greeting",
           {{"type", "string"}, {"description", "The greeting to use"}}}}},
        {"required", {"greeting"}}};
    return descriptor;
}

protocol::ToolResult hello_world(const json& arguments) {
    std::string greeting = "Hello";
    if (arguments.is_object()) {
        const auto it = arguments.find("greeting");
        if (it != arguments.end() && it->is_string()) {
            greeting = it->get<std::string>();
        }
    }
    return protocol::text_result(greeting + " World!");
}

core::errors::Result<std::size_t> register_hello_world(ToolRegistry& registry) {
    return registry.register_tool(hello_world_descriptor(), hello_world);
}

}  // namespace vidmcp::tools

#include "server/mcp_methods.hpp"

#include "core/logging/logger.hpp"
#include "protocol/tool_contract.hpp"

namespace vidmcp::server {

using core::errors::ErrorCategory;
using core::errors::ServerError;
using nlohmann::json;

core::errors::Result<json> handle_initialize(const ServerInfo& info, const json& params) {
    if (params.is_object()) {
        const auto client = params.find("clientInfo");
        if (client != params.end() && client->is_object()) {
            LOG_INFO("initialize from " + client->value("name", std::string("unknown")) +
                     " " + client->value("version", std::string("")));
        }
    }
    return json{{"protocolVersion", info.protocol_version},
                {"capabilities", {{"tools", {{"listChanged", false}}}}},
                {"serverInfo", {{"name", info.name}, {"version", info.version}}}};
}

core::errors::Result<json> handle_tools_list(const tools::ToolRegistry& registry,
                                             const json& /*params*/) {
    return json{{"tools", registry.list_tools_json()}};
}

core::errors::Result<json> handle_tools_call(const tools::ToolRegistry& registry,
                                             const json& params) {
    if (!params.is_object()) {
        return ServerError{ErrorCategory::Input, "tools/call params must be an object.",
                           "invalid_params"};
    }
    const auto name = params.find("name");
    if (name == params.end() || !name->is_string()) {
        return ServerError{ErrorCategory::Input,
                           "tools/call requires a string \"name\" parameter.",
                           "invalid_params"};
    }

    json arguments = json::object();
    const auto args = params.find("arguments");
    if (args != params.end() && !args->is_null()) {
        arguments = *args;
    }

    const auto tool_name = name->get<std::string>();
    LOG_DEBUG("tools/call " + tool_name);
    const auto result = registry.invoke(tool_name, arguments);
    if (result.is_error) {
        LOG_WARN("tools/call " + tool_name + " returned an error result");
    }
    return protocol::to_json(result);
}

void register_mcp_methods(RequestRouter& router, const tools::ToolRegistry& registry,
                          const ServerInfo& info) {
    router.register_method("initialize", [info](const json& params) {
        return handle_initialize(info, params);
    });
    router.register_notification("notifications/initialized", [](const json&) {
        LOG_INFO("client initialized");
    });
    router.register_method("ping", [](const json&) -> core::errors::Result<json> {
        return json::object();
    });
    router.register_method("tools/list", [&registry](const json& params) {
        return handle_tools_list(registry, params);
    });
    router.register_method("tools/call", [&registry](const json& params) {
        return handle_tools_call(registry, params);
    });
}

}  // namespace vidmcp::server

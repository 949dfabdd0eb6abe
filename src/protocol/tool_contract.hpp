#pragma once
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace vidmcp::protocol {

    // What a client sees in tools/list. Immutable once registered.
    struct ToolDescriptor {
        std::string name;
        std::string description;
        nlohmann::json input_schema;  // JSON-schema object
    };

    enum class ContentType {
        Text
    };

    struct ContentBlock {
        ContentType type = ContentType::Text;
        std::string text;
    };

    // How a tool replies. Tool failures are still valid protocol responses,
    // flagged with is_error rather than a JSON-RPC error object.
    struct ToolResult {
        std::vector<ContentBlock> content;
        bool is_error = false;
    };

    inline ToolResult text_result(std::string text, const bool is_error = false) {
        ToolResult result;
        result.content.push_back(ContentBlock{ContentType::Text, std::move(text)});
        result.is_error = is_error;
        return result;
    }

    inline nlohmann::json to_json(const ToolDescriptor& descriptor) {
        return nlohmann::json{{"name", descriptor.name},
                              {"description", descriptor.description},
                              {"inputSchema", descriptor.input_schema}};
    }

    inline nlohmann::json to_json(const ToolResult& result) {
        nlohmann::json content = nlohmann::json::array();
        for (const auto& block : result.content) {
            switch (block.type) {
                case ContentType::Text:
                    content.push_back({{"type", "text"}, {"text", block.text}});
                    break;
            }
        }
        return nlohmann::json{{"content", content}, {"isError", result.is_error}};
    }

} // namespace vidmcp::protocol

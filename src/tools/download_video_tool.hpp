#pragma once

#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/server_errors.hpp"
#include "download/download_orchestrator.hpp"
#include "protocol/download_contract.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/tool_registry.hpp"

namespace vidmcp::tools {

inline constexpr const char* kDownloadVideoTool = "download_video";

protocol::ToolDescriptor download_video_descriptor();

// url is required and must pass the URL policy; quality falls back to 720p;
// audio_only defaults to false.
core::errors::Result<protocol::DownloadOptions> parse_download_arguments(
    const nlohmann::json& arguments);

// Human-readable summary, followed by the inline block when the payload is
// inline bytes.
std::string render_download_success(const protocol::DownloadSuccess& success,
                                    bool audio_only);

class DownloadVideoTool {
public:
    explicit DownloadVideoTool(std::shared_ptr<const download::DownloadOrchestrator> orchestrator);

    protocol::ToolResult operator()(const nlohmann::json& arguments) const;

private:
    std::shared_ptr<const download::DownloadOrchestrator> orchestrator_;
};

core::errors::Result<std::size_t> register_download_video(
    ToolRegistry& registry,
    std::shared_ptr<const download::DownloadOrchestrator> orchestrator);

}  // namespace vidmcp::tools

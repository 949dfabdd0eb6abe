#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include "app/cli_parser.hpp"
#include "core/config/unique_id.hpp"
#include "core/errors/server_errors.hpp"
#include "core/logging/logger.hpp"
#include "download/download_orchestrator.hpp"
#include "download/ytdlp_extractor.hpp"
#include "payload/payload_encoder.hpp"
#include "runtime/worker_pool.hpp"
#include "server/mcp_methods.hpp"
#include "server/request_router.hpp"
#include "server/server_loop.hpp"
#include "tools/download_video_tool.hpp"
#include "tools/hello_world_tool.hpp"
#include "tools/tool_registry.hpp"
#include "transport/framed_channel.hpp"

int main(int argc, char* argv[]) {
    // 1. Tag every log line of this process
    vidmcp::core::logging::Logger::get().set_session_id(
        vidmcp::core::config::generate_unique_id("session-"));

    // 2. Parse configuration and return normalized input errors
    auto parsed = vidmcp::app::cli::parse_and_validate(argc, argv);
    if (vidmcp::core::errors::is_error(parsed)) {
        const auto& err = vidmcp::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto config = vidmcp::core::errors::take_value(std::move(parsed));
    vidmcp::core::logging::Logger::get().set_min_level(config.log_level);

    // A client that closes its end must not kill the process mid-write.
    std::signal(SIGPIPE, SIG_IGN);

    LOG_INFO("Starting vidmcp: payload mode " +
             vidmcp::core::config::to_string(config.payload_mode) + ", extractor " +
             config.extractor_binary + ", " + std::to_string(config.worker_threads) +
             " worker(s)");

    // 3. Download pipeline
    vidmcp::download::YtDlpConfig extractor_config;
    extractor_config.binary = config.extractor_binary;
    extractor_config.timeout_ms = config.extractor_timeout_ms;
    auto orchestrator = std::make_shared<const vidmcp::download::DownloadOrchestrator>(
        config.scratch_root,
        std::make_shared<vidmcp::download::YtDlpExtractor>(extractor_config),
        vidmcp::payload::make_payload_encoder(config));

    // 4. Tools
    vidmcp::tools::ToolRegistry registry;
    for (auto registered : {vidmcp::tools::register_hello_world(registry),
                            vidmcp::tools::register_download_video(registry, orchestrator)}) {
        if (vidmcp::core::errors::is_error(registered)) {
            const auto& err = vidmcp::core::errors::get_error(registered);
            LOG_ERROR("Failed to register tool [" + err.code + "]: " + err.message);
            return 1;
        }
    }

    // 5. Protocol surface and serve until stdin closes
    vidmcp::server::RequestRouter router;
    vidmcp::server::register_mcp_methods(router, registry);

    vidmcp::transport::FramedChannel channel(std::cin, std::cout);
    vidmcp::runtime::WorkerPool pool(config.worker_threads);
    vidmcp::server::ServerLoop loop(channel, router, pool);
    loop.offload_method("tools/call");
    loop.run();

    pool.shutdown();
    LOG_INFO("vidmcp stopped after " + std::to_string(channel.messages_written()) +
             " response(s)");
    return 0;
}

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/server_errors.hpp"
#include "download/download_orchestrator.hpp"
#include "fake_extractor.hpp"
#include "payload/inline_block.hpp"
#include "payload/payload_encoder.hpp"
#include "tools/download_video_tool.hpp"
#include "tools/tool_registry.hpp"

namespace {

using nlohmann::json;
using vidmcp::core::errors::get_error;
using vidmcp::core::errors::get_value;
using vidmcp::core::errors::is_error;
using vidmcp::download::DownloadOrchestrator;
using vidmcp::payload::FileRefPayloadEncoder;
using vidmcp::payload::InlinePayloadEncoder;
using vidmcp::protocol::DownloadSuccess;
using vidmcp::protocol::FileRef;
using vidmcp::protocol::Quality;
using vidmcp::testing::FakeExtractor;
using vidmcp::testing::TempWorkspace;
using vidmcp::tools::DownloadVideoTool;
using vidmcp::tools::parse_download_arguments;
using vidmcp::tools::render_download_success;

class DownloadVideoToolTest : public ::testing::Test {
protected:
    DownloadVideoToolTest()
        : workspace_("download_tool"),
          extractor_(std::make_shared<FakeExtractor>()) {
        std::filesystem::create_directories(workspace_.root() / "scratch");
    }

    DownloadVideoTool make_tool(bool file_mode = false) const {
        std::shared_ptr<const vidmcp::payload::PayloadEncoder> encoder;
        if (file_mode) {
            encoder = std::make_shared<FileRefPayloadEncoder>(workspace_.root() / "shared");
        } else {
            encoder = std::make_shared<InlinePayloadEncoder>();
        }
        return DownloadVideoTool(std::make_shared<const DownloadOrchestrator>(
            workspace_.root() / "scratch", extractor_, encoder));
    }

    TempWorkspace workspace_;
    std::shared_ptr<FakeExtractor> extractor_;
};

TEST(DownloadArgumentsTest, AppliesDefaults) {
    auto parsed = parse_download_arguments(json{{"url", "https://example.com/v"}});
    ASSERT_FALSE(is_error(parsed));
    EXPECT_EQ(get_value(parsed).url, "https://example.com/v");
    EXPECT_EQ(get_value(parsed).quality, Quality::P720);
    EXPECT_FALSE(get_value(parsed).audio_only);
}

TEST(DownloadArgumentsTest, ReadsQualityAndAudioOnly) {
    auto parsed = parse_download_arguments(
        json{{"url", "https://example.com/v"}, {"quality", "best"}, {"audio_only", true}});
    ASSERT_FALSE(is_error(parsed));
    EXPECT_EQ(get_value(parsed).quality, Quality::Best);
    EXPECT_TRUE(get_value(parsed).audio_only);
}

TEST(DownloadArgumentsTest, InvalidOptionalValuesFallBack) {
    auto parsed = parse_download_arguments(
        json{{"url", "https://example.com/v"}, {"quality", 1080}, {"audio_only", "yes"}});
    ASSERT_FALSE(is_error(parsed));
    EXPECT_EQ(get_value(parsed).quality, Quality::P720);
    EXPECT_FALSE(get_value(parsed).audio_only);
}

TEST(DownloadArgumentsTest, MissingOrEmptyUrlIsRejected) {
    for (const auto& arguments :
         {json::object(), json{{"url", ""}}, json{{"url", 5}}, json{{"url", "   "}}}) {
        auto parsed = parse_download_arguments(arguments);
        ASSERT_TRUE(is_error(parsed));
        EXPECT_EQ(get_error(parsed).message,
                  "Invalid URL provided. Please provide a valid video URL.");
    }
}

TEST(DownloadSummaryTest, RendersMetadataLines) {
    DownloadSuccess success;
    success.title = "My Clip";
    success.uploader = "Someone";
    success.duration_seconds = 90.0;
    success.view_count = 1234567;
    success.file_name = "My Clip.mp4";
    success.file_size_bytes = 3 * 1024 * 1024;
    success.mime_type = "video/mp4";
    success.progress_log = {"Download completed: My Clip.mp4"};
    success.payload = FileRef{"/downloads/My Clip.mp4"};

    EXPECT_EQ(render_download_success(success, false),
              "Video downloaded successfully!\n\n"
              "Title: My Clip\n"
              "Uploader: Someone\n"
              "Duration: 1.5 minutes\n"
              "Views: 1,234,567\n"
              "File: /downloads/My Clip.mp4\n"
              "Size: 3.0 MB\n"
              "Mode: Video\n"
              "\n"
              "Progress Log:\n"
              "  - Download completed: My Clip.mp4");
}

TEST(DownloadSummaryTest, GroupsViewsInThousands) {
    DownloadSuccess success;
    success.title = "Counted";
    success.uploader = "Someone";
    success.file_name = "c.mp4";
    success.payload = FileRef{"/downloads/c.mp4"};

    const std::pair<std::int64_t, std::string> cases[] = {
        {7, "Views: 7\n"},
        {999, "Views: 999\n"},
        {1000, "Views: 1,000\n"},
        {12345, "Views: 12,345\n"},
        {123456, "Views: 123,456\n"},
        {12345678, "Views: 12,345,678\n"},
        {12345678901, "Views: 12,345,678,901\n"}};
    for (const auto& [views, line] : cases) {
        success.view_count = views;
        EXPECT_NE(render_download_success(success, false).find(line), std::string::npos)
            << line;
    }
}

TEST(DownloadSummaryTest, OmitsZeroDurationAndViews) {
    DownloadSuccess success;
    success.title = "Unknown Title";
    success.uploader = "Unknown";
    success.file_name = "a.mp3";
    success.payload = FileRef{"/downloads/a.mp3"};

    const auto text = render_download_success(success, true);
    EXPECT_EQ(text.find("Duration:"), std::string::npos);
    EXPECT_EQ(text.find("Views:"), std::string::npos);
    EXPECT_NE(text.find("Mode: Audio Only (MP3)"), std::string::npos);
}

TEST_F(DownloadVideoToolTest, InlineResultCarriesDecodableBlock) {
    const auto tool = make_tool();
    const auto result = tool(json{{"url", "https://example.com/inline"}});
    ASSERT_FALSE(result.is_error);
    ASSERT_EQ(result.content.size(), 1u);

    const std::string& text = result.content[0].text;
    EXPECT_EQ(text.rfind("Video downloaded successfully!", 0), 0u);
    EXPECT_NE(text.find("Title: Clip inline"), std::string::npos);
    EXPECT_NE(text.find("Views: 1,234,567"), std::string::npos);
    EXPECT_NE(text.find("Duration: 2.5 minutes"), std::string::npos);
    EXPECT_NE(text.find("File Data (Base64):"), std::string::npos);

    auto block = vidmcp::payload::parse_inline_block(text);
    ASSERT_FALSE(is_error(block));
    EXPECT_EQ(get_value(block).file_name, "Clip inline.mp4");
    EXPECT_EQ(get_value(block).mime_type, "video/mp4");
    EXPECT_EQ(get_value(block).bytes, FakeExtractor::kVideoBytes);
}

TEST_F(DownloadVideoToolTest, FileModeResultNamesSharedPath) {
    const auto tool = make_tool(true);
    const auto result = tool(json{{"url", "https://example.com/shared"}});
    ASSERT_FALSE(result.is_error);

    const std::string& text = result.content[0].text;
    const auto expected = workspace_.root() / "shared" / "Clip shared.mp4";
    EXPECT_NE(text.find("File: " + expected.string()), std::string::npos);
    EXPECT_EQ(text.find("FILE_DATA_START"), std::string::npos);
    EXPECT_TRUE(std::filesystem::exists(expected));
}

TEST_F(DownloadVideoToolTest, EmptyUrlIsToolErrorWithoutExtraction) {
    const auto tool = make_tool();
    const auto result = tool(json{{"url", ""}});
    EXPECT_TRUE(result.is_error);
    EXPECT_EQ(result.content[0].text,
              "Error: Invalid URL provided. Please provide a valid video URL.");
    EXPECT_EQ(extractor_->calls(), 0);
}

TEST_F(DownloadVideoToolTest, ExtractionFailureIsToolError) {
    const auto tool = make_tool();
    const auto result = tool(json{{"url", "https://example.com/fail"}});
    EXPECT_TRUE(result.is_error);
    EXPECT_EQ(result.content[0].text,
              "Video download error: yt-dlp download error: Video unavailable");
}

TEST_F(DownloadVideoToolTest, RegistersWithSchema) {
    vidmcp::tools::ToolRegistry registry;
    auto registered = vidmcp::tools::register_download_video(
        registry, std::make_shared<const DownloadOrchestrator>(
                      workspace_.root() / "scratch", extractor_,
                      std::make_shared<InlinePayloadEncoder>()));
    ASSERT_FALSE(is_error(registered));

    const auto tools = registry.list_tools_json();
    ASSERT_EQ(tools.size(), 1u);
    EXPECT_EQ(tools[0].at("name"), "download_video");
    const auto& schema = tools[0].at("inputSchema");
    EXPECT_EQ(schema.at("required"), json::array({"url"}));
    EXPECT_EQ(schema.at("properties").at("quality").at("default"), "720p");
    EXPECT_EQ(schema.at("properties").at("audio_only").at("default"), false);
}

}  // namespace

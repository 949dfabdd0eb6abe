#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <variant>
#include <gtest/gtest.h>
#include "codec/base64.hpp"
#include "download/download_orchestrator.hpp"
#include "fake_extractor.hpp"
#include "payload/payload_encoder.hpp"

namespace {

using vidmcp::download::DownloadOrchestrator;
using vidmcp::payload::FileRefPayloadEncoder;
using vidmcp::payload::InlinePayloadEncoder;
using vidmcp::protocol::DownloadFailure;
using vidmcp::protocol::DownloadOptions;
using vidmcp::protocol::DownloadResult;
using vidmcp::protocol::DownloadSuccess;
using vidmcp::protocol::FileRef;
using vidmcp::protocol::InlineBytes;
using vidmcp::protocol::Quality;
using vidmcp::testing::directory_is_empty;
using vidmcp::testing::FakeExtractor;
using vidmcp::testing::TempWorkspace;

DownloadOptions options_for(const std::string& url) {
    DownloadOptions options;
    options.url = url;
    return options;
}

class DownloadOrchestratorTest : public ::testing::Test {
protected:
    DownloadOrchestratorTest()
        : workspace_("orchestrator"),
          extractor_(std::make_shared<FakeExtractor>()) {
        std::filesystem::create_directories(scratch_root());
    }

    std::filesystem::path scratch_root() const { return workspace_.root() / "scratch"; }

    DownloadOrchestrator make_inline(std::uintmax_t max_bytes = 0) const {
        return DownloadOrchestrator(scratch_root(), extractor_,
                                    std::make_shared<InlinePayloadEncoder>(max_bytes));
    }

    TempWorkspace workspace_;
    std::shared_ptr<FakeExtractor> extractor_;
};

TEST_F(DownloadOrchestratorTest, InlineSuccessCarriesMetadataAndProgress) {
    const auto orchestrator = make_inline();
    const DownloadResult result = orchestrator.download(options_for("https://example.com/one"));

    const auto* success = std::get_if<DownloadSuccess>(&result);
    ASSERT_TRUE(success != nullptr);
    EXPECT_EQ(success->title, "Clip one");
    EXPECT_EQ(success->uploader, "Fake Uploader");
    EXPECT_EQ(success->view_count, 1234567);
    EXPECT_EQ(success->file_name, "Clip one.mp4");
    EXPECT_EQ(success->mime_type, "video/mp4");
    EXPECT_EQ(success->file_size_bytes, std::string(FakeExtractor::kVideoBytes).size());

    ASSERT_EQ(success->progress_log.size(), 3u);
    EXPECT_EQ(success->progress_log[0], "Downloading Clip one.mp4: 10.0% at 1.00MiB/s");
    EXPECT_EQ(success->progress_log[1], "Downloading Clip one.mp4: 90.0% at 2.00MiB/s");
    EXPECT_EQ(success->progress_log[2], "Download completed: Clip one.mp4");

    const auto* bytes = std::get_if<InlineBytes>(&success->payload);
    ASSERT_TRUE(bytes != nullptr);
    EXPECT_EQ(bytes->base64,
              vidmcp::codec::base64_encode(std::string(FakeExtractor::kVideoBytes)));
}

TEST_F(DownloadOrchestratorTest, ScratchDirectoryRemovedOnSuccessAndFailure) {
    const auto orchestrator = make_inline();
    orchestrator.download(options_for("https://example.com/one"));
    EXPECT_TRUE(directory_is_empty(scratch_root()));

    orchestrator.download(options_for("https://example.com/fail"));
    EXPECT_TRUE(directory_is_empty(scratch_root()));
}

TEST_F(DownloadOrchestratorTest, ExtractionFailureBecomesDownloadFailure) {
    const auto orchestrator = make_inline();
    const auto result = orchestrator.download(options_for("https://example.com/fail"));

    const auto* failure = std::get_if<DownloadFailure>(&result);
    ASSERT_TRUE(failure != nullptr);
    EXPECT_EQ(failure->message, "yt-dlp download error: Video unavailable");
}

TEST_F(DownloadOrchestratorTest, MissingArtifactIsReported) {
    const auto orchestrator = make_inline();
    const auto result = orchestrator.download(options_for("https://example.com/nofile"));

    const auto* failure = std::get_if<DownloadFailure>(&result);
    ASSERT_TRUE(failure != nullptr);
    EXPECT_EQ(failure->message.rfind("Download completed but file not found", 0), 0u);
}

TEST_F(DownloadOrchestratorTest, RenamedArtifactIsFoundBySibling) {
    const auto orchestrator = make_inline();
    const auto result = orchestrator.download(options_for("https://example.com/renamed"));

    const auto* success = std::get_if<DownloadSuccess>(&result);
    ASSERT_TRUE(success != nullptr);
    EXPECT_EQ(success->file_name, "Clip renamed.mp3");
    EXPECT_EQ(success->mime_type, "audio/mpeg");
}

TEST_F(DownloadOrchestratorTest, SelectsFormatFromOptions) {
    const auto orchestrator = make_inline();

    auto options = options_for("https://example.com/q");
    options.quality = Quality::P360;
    orchestrator.download(options);
    EXPECT_EQ(extractor_->last_format(), "best[height<=360]");

    options.audio_only = true;
    orchestrator.download(options);
    EXPECT_EQ(extractor_->last_format(), "bestaudio/best");
}

TEST_F(DownloadOrchestratorTest, InlineSizeCapFailsDownload) {
    const auto orchestrator = make_inline(4);
    const auto result = orchestrator.download(options_for("https://example.com/big"));

    const auto* failure = std::get_if<DownloadFailure>(&result);
    ASSERT_TRUE(failure != nullptr);
    EXPECT_NE(failure->message.find("too large"), std::string::npos);
    EXPECT_TRUE(directory_is_empty(scratch_root()));
}

TEST_F(DownloadOrchestratorTest, FileModeLeavesArtifactInSharedDirectory) {
    const auto shared = workspace_.root() / "shared";
    const DownloadOrchestrator orchestrator(scratch_root(), extractor_,
                                            std::make_shared<FileRefPayloadEncoder>(shared));
    const auto result = orchestrator.download(options_for("https://example.com/keep"));

    const auto* success = std::get_if<DownloadSuccess>(&result);
    ASSERT_TRUE(success != nullptr);
    const auto* ref = std::get_if<FileRef>(&success->payload);
    ASSERT_TRUE(ref != nullptr);
    EXPECT_EQ(std::filesystem::path(ref->path), shared / "Clip keep.mp4");
    EXPECT_TRUE(std::filesystem::exists(ref->path));
    EXPECT_TRUE(directory_is_empty(scratch_root()));
}

TEST_F(DownloadOrchestratorTest, ConcurrentDownloadsKeepSeparateLogs) {
    const auto orchestrator = make_inline();
    DownloadResult first;
    DownloadResult second;
    std::thread a([&]() { first = orchestrator.download(options_for("https://example.com/slow-a")); });
    std::thread b([&]() { second = orchestrator.download(options_for("https://example.com/slow-b")); });
    a.join();
    b.join();

    const auto* one = std::get_if<DownloadSuccess>(&first);
    const auto* two = std::get_if<DownloadSuccess>(&second);
    ASSERT_TRUE(one != nullptr);
    ASSERT_TRUE(two != nullptr);
    EXPECT_EQ(one->file_name, "Clip slow-a.mp4");
    EXPECT_EQ(two->file_name, "Clip slow-b.mp4");
    ASSERT_EQ(one->progress_log.size(), 3u);
    ASSERT_EQ(two->progress_log.size(), 3u);
    for (const auto& line : one->progress_log) {
        EXPECT_NE(line.find("slow-a"), std::string::npos);
    }
    for (const auto& line : two->progress_log) {
        EXPECT_NE(line.find("slow-b"), std::string::npos);
    }
    EXPECT_EQ(extractor_->calls(), 2);
    EXPECT_TRUE(directory_is_empty(scratch_root()));
}

}  // namespace

#include "panxfer/transfer/download_streamer.hpp"
#include "support/fake_transport.hpp"
#include "support/temp_files.hpp"

#include <gtest/gtest.h>

#include <vector>

namespace fs = std::filesystem;
using panxfer::ErrorKind;
using panxfer::api::ResolvedDownloadUrl;
using panxfer::events::ProgressEvent;
using panxfer::events::ProgressReporter;
using panxfer::events::TransferStatus;
using panxfer::transfer::DownloadStreamer;
using panxfer::testing::FakeTransport;

namespace {

constexpr const char* kCdnUrl = "https://cdn.example/bytes/42";

class DownloadStreamerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = panxfer::testing::create_temp_dir("panxfer_download_test");
        transport.set_chunk_size(100);
    }

    void serve(std::string body, std::optional<std::uint64_t> content_length, long status = 200) {
        auto response = FakeTransport::make_response(status, std::move(body));
        response.content_length = content_length;
        transport.add("cdn.example/bytes/42", response);
    }

    fs::path dir;
    FakeTransport transport;
    std::vector<ProgressEvent> events;
    ProgressReporter reporter{"42", [this](const ProgressEvent& e) { events.push_back(e); }};
};

} // namespace

TEST_F(DownloadStreamerTest, KnownLengthReportsEveryChunk) {
    const auto body = panxfer::testing::patterned_bytes(1000);
    serve(body, 1000);

    DownloadStreamer streamer(transport);
    auto written = streamer.stream_to_file({kCdnUrl, std::nullopt}, dir / "out.bin", reporter);

    ASSERT_TRUE(written.is_ok());
    EXPECT_EQ(written.value(), 1000u);
    EXPECT_EQ(panxfer::testing::read_file(dir / "out.bin"), body);

    ASSERT_EQ(events.size(), 11u);
    for (std::size_t i = 0; i < 10; ++i) {
        EXPECT_EQ(events[i].status, TransferStatus::Downloading);
        EXPECT_EQ(events[i].percent, (i + 1) * 10);
        EXPECT_EQ(events[i].bytes_transferred, (i + 1) * 100);
    }
    EXPECT_EQ(events[10].status, TransferStatus::Finished);
    EXPECT_EQ(events[10].percent, 100u);
    EXPECT_EQ(events[10].bytes_transferred, 1000u);
}

TEST_F(DownloadStreamerTest, FollowsRedirectsOnFinalRequest) {
    serve("abc", 3);

    DownloadStreamer streamer(transport);
    ASSERT_TRUE(streamer.stream_to_file({kCdnUrl, std::nullopt}, dir / "out.bin", reporter).is_ok());

    const auto sent = transport.requests();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].url, kCdnUrl);
    EXPECT_TRUE(sent[0].follow_redirects);
}

TEST_F(DownloadStreamerTest, UnknownLengthOnlyReportsCompletion) {
    serve(std::string(250, 'x'), std::nullopt);

    DownloadStreamer streamer(transport);
    auto written = streamer.stream_to_file({kCdnUrl, std::nullopt}, dir / "out.bin", reporter);

    ASSERT_TRUE(written.is_ok());
    EXPECT_EQ(written.value(), 250u);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].status, TransferStatus::Finished);
    EXPECT_EQ(events[0].percent, 100u);
    EXPECT_EQ(events[0].bytes_transferred, 250u);
}

TEST_F(DownloadStreamerTest, DeclaredSizeUsedWithoutContentLength) {
    serve(std::string(200, 'x'), std::nullopt);

    DownloadStreamer streamer(transport);
    ASSERT_TRUE(streamer.stream_to_file({kCdnUrl, 400}, dir / "out.bin", reporter).is_ok());

    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].percent, 25u);
    EXPECT_EQ(events[1].percent, 50u);
    EXPECT_EQ(events[2].status, TransferStatus::Finished);
    EXPECT_EQ(events[2].percent, 100u);
}

TEST_F(DownloadStreamerTest, ZeroContentLengthFallsBackToDeclaredSize) {
    EXPECT_EQ(DownloadStreamer::effective_total(0, 50).value_or(0), 50u);
    EXPECT_EQ(DownloadStreamer::effective_total(80, 50).value_or(0), 80u);
    EXPECT_FALSE(DownloadStreamer::effective_total(std::nullopt, 0).has_value());
    EXPECT_FALSE(DownloadStreamer::effective_total(0, std::nullopt).has_value());
}

TEST_F(DownloadStreamerTest, ErrorStatusCreatesNoFile) {
    serve("Forbidden", 9, 403);

    DownloadStreamer streamer(transport);
    auto written = streamer.stream_to_file({kCdnUrl, std::nullopt}, dir / "out.bin", reporter);

    ASSERT_TRUE(written.is_error());
    EXPECT_EQ(written.error().kind, ErrorKind::Api);
    EXPECT_EQ(written.error().code, 403);
    EXPECT_FALSE(fs::exists(dir / "out.bin"));
    EXPECT_TRUE(events.empty());
}

TEST_F(DownloadStreamerTest, InterruptedStreamIsNetworkError) {
    FakeTransport::Scripted scripted;
    scripted.response = FakeTransport::make_response(200, std::string(1000, 'x'));
    scripted.response.content_length = 1000;
    scripted.interrupt_at = 300;
    transport.add("cdn.example/bytes/42", scripted);

    DownloadStreamer streamer(transport);
    auto written = streamer.stream_to_file({kCdnUrl, std::nullopt}, dir / "out.bin", reporter);

    ASSERT_TRUE(written.is_error());
    EXPECT_EQ(written.error().kind, ErrorKind::Network);
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events.back().percent, 30u);
    EXPECT_NE(events.back().status, TransferStatus::Finished);
}

TEST_F(DownloadStreamerTest, UnwritableDestinationIsIoError) {
    serve("abc", 3);

    DownloadStreamer streamer(transport);
    auto written = streamer.stream_to_file({kCdnUrl, std::nullopt}, dir / "missing" / "out.bin", reporter);

    ASSERT_TRUE(written.is_error());
    EXPECT_EQ(written.error().kind, ErrorKind::Io);
}

TEST_F(DownloadStreamerTest, OverwritesExistingFile) {
    panxfer::testing::write_file(dir / "out.bin", std::string(5000, 'o'));
    serve("fresh", 5);

    DownloadStreamer streamer(transport);
    ASSERT_TRUE(streamer.stream_to_file({kCdnUrl, std::nullopt}, dir / "out.bin", reporter).is_ok());
    EXPECT_EQ(panxfer::testing::read_file(dir / "out.bin"), "fresh");
}

#include "panxfer/transfer/transfer_session.hpp"

#include <gtest/gtest.h>

using namespace panxfer::transfer;

TEST(TransferSession, UploadChunkedPath) {
    TransferSession session(TransferDirection::Upload, "/data/a.bin", "0");
    EXPECT_EQ(session.state(), TransferState::Idle);

    EXPECT_TRUE(session.transition_to(TransferState::Hashing).is_ok());
    EXPECT_TRUE(session.transition_to(TransferState::Negotiating).is_ok());
    EXPECT_TRUE(session.transition_to(TransferState::ChunkUploading).is_ok());
    EXPECT_TRUE(session.transition_to(TransferState::Finalizing).is_ok());
    EXPECT_TRUE(session.transition_to(TransferState::Finished).is_ok());
    EXPECT_EQ(session.state(), TransferState::Finished);
}

TEST(TransferSession, UploadReusePath) {
    TransferSession session(TransferDirection::Upload, "/data/a.bin", "0");
    ASSERT_TRUE(session.transition_to(TransferState::Hashing).is_ok());
    ASSERT_TRUE(session.transition_to(TransferState::Negotiating).is_ok());
    EXPECT_TRUE(session.transition_to(TransferState::Reused).is_ok());
    EXPECT_TRUE(session.transition_to(TransferState::Finished).is_ok());
}

TEST(TransferSession, RejectsSkippedStates) {
    TransferSession session(TransferDirection::Upload, "/data/a.bin", "0");
    auto skipped = session.transition_to(TransferState::ChunkUploading);
    ASSERT_TRUE(skipped.is_error());
    EXPECT_EQ(session.state(), TransferState::Idle);

    ASSERT_TRUE(session.transition_to(TransferState::Hashing).is_ok());
    EXPECT_TRUE(session.transition_to(TransferState::Streaming).is_error());
}

TEST(TransferSession, DownloadPath) {
    TransferSession session(TransferDirection::Download, "/tmp/out.bin", "42");
    EXPECT_TRUE(session.transition_to(TransferState::RequestingTicket).is_ok());
    EXPECT_TRUE(session.transition_to(TransferState::Resolving).is_ok());
    EXPECT_TRUE(session.transition_to(TransferState::Streaming).is_ok());
    EXPECT_TRUE(session.transition_to(TransferState::Finished).is_ok());
    EXPECT_TRUE(session.transition_to(TransferState::Failed).is_error());
}

TEST(TransferSession, FailedFromAnyLiveState) {
    TransferSession session(TransferDirection::Download, "/tmp/out.bin", "42");
    ASSERT_TRUE(session.transition_to(TransferState::RequestingTicket).is_ok());
    ASSERT_TRUE(session.transition_to(TransferState::Resolving).is_ok());

    EXPECT_TRUE(session.mark_failed("ResolutionError: no download URL found").is_ok());
    EXPECT_EQ(session.state(), TransferState::Failed);
    EXPECT_EQ(session.last_error(), "ResolutionError: no download URL found");
    EXPECT_TRUE(session.transition_to(TransferState::Streaming).is_error());
}

TEST(TransferSession, PercentIsFlooredAndGuarded) {
    TransferSession session(TransferDirection::Upload, "/data/a.bin", "0");
    EXPECT_EQ(session.percent(), 0u);

    session.add_progress(10);
    EXPECT_EQ(session.percent(), 0u);

    session.set_total_bytes(12);
    session.add_progress(1);
    EXPECT_EQ(session.bytes_done(), 11u);
    EXPECT_EQ(session.percent(), 91u);

    session.add_progress(20);
    EXPECT_EQ(session.percent(), 100u);
}

TEST(TransferSession, StateNames) {
    EXPECT_STREQ(to_string(TransferState::ChunkUploading), "ChunkUploading");
    EXPECT_STREQ(to_string(TransferState::RequestingTicket), "RequestingTicket");
    EXPECT_STREQ(to_string(TransferState::Failed), "Failed");
}

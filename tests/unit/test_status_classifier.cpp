#include <gtest/gtest.h>
#include "torrentflow/session/status_classifier.hpp"
#include "torrentflow/session/snapshot_builder.hpp"

using namespace torrentflow::session;

class StatusClassifierTest : public ::testing::Test {};

TEST_F(StatusClassifierTest, ClassificationTable) {
    EXPECT_EQ(classify(100, 100, 0, 0), TransferStatus::COMPLETED);
    EXPECT_EQ(classify(100, 100, 2, 0), TransferStatus::SEEDING);
    EXPECT_EQ(classify(50, 100, 0, 3), TransferStatus::STALLED);
    EXPECT_EQ(classify(50, 100, 0, 0), TransferStatus::PAUSED);
    EXPECT_EQ(classify(50, 100, 2, 0), TransferStatus::DOWNLOADING);
}

TEST_F(StatusClassifierTest, OvershootCountsAsComplete) {
    EXPECT_EQ(classify(120, 100, 0, 0), TransferStatus::COMPLETED);
    EXPECT_EQ(classify(120, 100, 1, 5), TransferStatus::SEEDING);
}

TEST_F(StatusClassifierTest, UnknownMetadataIsNeverComplete) {
    EXPECT_EQ(classify(0, 0, 0, 0, false), TransferStatus::PAUSED);
    EXPECT_EQ(classify(0, 0, 0, 4, false), TransferStatus::STALLED);
    EXPECT_EQ(classify(0, 0, 3, 4, false), TransferStatus::DOWNLOADING);
}

TEST_F(StatusClassifierTest, StatusNames) {
    EXPECT_STREQ(to_string(TransferStatus::COMPLETED), "completed");
    EXPECT_STREQ(to_string(TransferStatus::SEEDING), "seeding");
    EXPECT_STREQ(to_string(TransferStatus::STALLED), "stalled");
    EXPECT_STREQ(to_string(TransferStatus::PAUSED), "paused");
    EXPECT_STREQ(to_string(TransferStatus::DOWNLOADING), "downloading");
}

TEST_F(StatusClassifierTest, ProgressIsBounded) {
    EXPECT_DOUBLE_EQ(compute_progress(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(compute_progress(500, 0), 0.0);
    EXPECT_DOUBLE_EQ(compute_progress(50, 100), 50.0);
    EXPECT_DOUBLE_EQ(compute_progress(100, 100), 100.0);
    EXPECT_DOUBLE_EQ(compute_progress(150, 100), 100.0);
    EXPECT_NEAR(compute_progress(1, 3), 33.333, 0.001);
}

class SnapshotBuilderTest : public ::testing::Test {};

TEST_F(SnapshotBuilderTest, EstimateEta) {
    using std::chrono::seconds;

    auto eta = estimate_eta(0, 1000, 100);
    ASSERT_TRUE(eta.has_value());
    EXPECT_EQ(*eta, seconds(10));

    auto rounded_down = estimate_eta(0, 1000, 300);
    ASSERT_TRUE(rounded_down.has_value());
    EXPECT_EQ(*rounded_down, seconds(3));

    EXPECT_FALSE(estimate_eta(0, 1000, 0).has_value());
    EXPECT_FALSE(estimate_eta(1000, 1000, 100).has_value());
    EXPECT_FALSE(estimate_eta(0, 0, 100, false).has_value());
}

TEST_F(SnapshotBuilderTest, FormatEta) {
    EXPECT_EQ(format_eta(std::nullopt), "Unknown");
    EXPECT_EQ(format_eta(std::chrono::seconds(42)), "42s");
    EXPECT_EQ(format_eta(std::chrono::seconds(3725)), "1h 2m");
}

TEST_F(SnapshotBuilderTest, AggregateStats) {
    std::vector<TransferSnapshot> snapshots(3);
    snapshots[0].status = TransferStatus::DOWNLOADING;
    snapshots[0].download_rate = 1000;
    snapshots[0].upload_rate = 10;
    snapshots[0].peers = 4;
    snapshots[1].status = TransferStatus::SEEDING;
    snapshots[1].upload_rate = 500;
    snapshots[1].peers = 2;
    snapshots[2].status = TransferStatus::STALLED;

    auto stats = aggregate_stats(snapshots);

    EXPECT_EQ(stats.total_download_rate, 1000);
    EXPECT_EQ(stats.total_upload_rate, 510);
    EXPECT_EQ(stats.total_peers, 6);
    EXPECT_EQ(stats.active_transfers, 2);
    EXPECT_EQ(stats.session_count, 3);

    auto empty = aggregate_stats({});
    EXPECT_EQ(empty.session_count, 0);
    EXPECT_EQ(empty.total_download_rate, 0);
}

/**
 * @file test_metrics.cpp
 * @brief Tests for MetricsCollector counters and exports
 */

#include <gtest/gtest.h>
#include <sstream>
#include <string>

#include "MetricsCollector.h"

using namespace CubeLink;

class MetricsCollectorTest : public ::testing::Test {
protected:
    void SetUp() override { MetricsCollector::instance().reset(); }
    void TearDown() override { MetricsCollector::instance().reset(); }

    // Value on the sample line for a metric, or -1 when absent
    static long long sample(const std::string& text, const std::string& name) {
        std::istringstream in(text);
        std::string line;
        while (std::getline(in, line)) {
            if (line.rfind(name + " ", 0) == 0) {
                return std::stoll(line.substr(name.size() + 1));
            }
        }
        return -1;
    }
};

TEST_F(MetricsCollectorTest, CountersFeedSnapshots) {
    auto& metrics = MetricsCollector::instance();
    metrics.incrementRoomsCreated();
    metrics.incrementTransfersStarted();
    metrics.incrementTransfersStarted();
    metrics.incrementTransfersCompleted();
    metrics.addBytesSent(4096);
    metrics.incrementDecryptionErrors();

    auto transfers = metrics.getTransferMetrics();
    EXPECT_EQ(transfers.roomsCreated, 1u);
    EXPECT_EQ(transfers.transfersStarted, 2u);
    EXPECT_EQ(transfers.transfersCompleted, 1u);
    EXPECT_EQ(transfers.bytesSent, 4096u);
    EXPECT_EQ(metrics.getSecurityMetrics().decryptionErrors, 1u);

    metrics.reset();
    EXPECT_EQ(metrics.getTransferMetrics().transfersStarted, 0u);
}

TEST_F(MetricsCollectorTest, SpeedIsMovingAverage) {
    auto& metrics = MetricsCollector::instance();
    metrics.recordTransferSpeed(1000);
    EXPECT_EQ(metrics.getTransferMetrics().avgTransferSpeedKBps, 1000u);
    metrics.recordTransferSpeed(2000);
    EXPECT_EQ(metrics.getTransferMetrics().avgTransferSpeedKBps, 1200u);
}

TEST_F(MetricsCollectorTest, PrometheusExposition) {
    auto& metrics = MetricsCollector::instance();
    metrics.incrementRoomsJoined();
    metrics.incrementTransfersFailed();
    metrics.incrementChecksumMismatches();
    metrics.addBytesReceived(123);
    metrics.incrementKeyExchanges();
    metrics.recordTransferSpeed(512);

    auto text = metrics.exportPrometheus();
    EXPECT_NE(text.find("# TYPE cubelink_bytes_received_total counter\n"), std::string::npos);
    EXPECT_NE(text.find("# TYPE cubelink_transfer_speed_kbps gauge\n"), std::string::npos);
    EXPECT_NE(text.find("# HELP cubelink_rooms_joined_total Rooms joined\n"), std::string::npos);

    EXPECT_EQ(sample(text, "cubelink_rooms_joined_total"), 1);
    EXPECT_EQ(sample(text, "cubelink_transfers_failed_total"), 1);
    EXPECT_EQ(sample(text, "cubelink_checksum_mismatches_total"), 1);
    EXPECT_EQ(sample(text, "cubelink_bytes_received_total"), 123);
    EXPECT_EQ(sample(text, "cubelink_key_exchanges_total"), 1);
    EXPECT_EQ(sample(text, "cubelink_transfers_completed_total"), 0);
    EXPECT_EQ(sample(text, "cubelink_transfer_speed_kbps"), 512);
    EXPECT_GE(sample(text, "cubelink_uptime_seconds"), 0);
    EXPECT_EQ(text.back(), '\n');
}

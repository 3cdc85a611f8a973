#include "MetricsCollector.h"
#include <sstream>
#include <iomanip>

namespace CubeLink {

    MetricsCollector::MetricsCollector()
        : startTime_(std::chrono::system_clock::now()) {
    }

    MetricsCollector& MetricsCollector::instance() {
        static MetricsCollector instance;
        return instance;
    }

    void MetricsCollector::recordTransferSpeed(uint64_t speedKBps) {
        // Exponential moving average, alpha = 0.2
        uint64_t current = avgTransferSpeedKBps_.load();
        uint64_t updated = current == 0 ? speedKBps : (current * 4 + speedKBps) / 5;
        avgTransferSpeedKBps_.store(updated);
    }

    TransferMetricsSnapshot MetricsCollector::getTransferMetrics() const {
        TransferMetricsSnapshot snapshot;
        snapshot.roomsCreated = roomsCreated_.load();
        snapshot.roomsJoined = roomsJoined_.load();
        snapshot.roomsLeft = roomsLeft_.load();
        snapshot.transfersStarted = transfersStarted_.load();
        snapshot.transfersCompleted = transfersCompleted_.load();
        snapshot.transfersFailed = transfersFailed_.load();
        snapshot.transfersCancelled = transfersCancelled_.load();
        snapshot.bytesSent = bytesSent_.load();
        snapshot.bytesReceived = bytesReceived_.load();
        snapshot.checksumMismatches = checksumMismatches_.load();
        snapshot.avgTransferSpeedKBps = avgTransferSpeedKBps_.load();
        return snapshot;
    }

    SecurityMetricsSnapshot MetricsCollector::getSecurityMetrics() const {
        SecurityMetricsSnapshot snapshot;
        snapshot.encryptionErrors = encryptionErrors_.load();
        snapshot.decryptionErrors = decryptionErrors_.load();
        snapshot.keyExchanges = keyExchanges_.load();
        return snapshot;
    }

    std::string MetricsCollector::getMetricsSummary() const {
        std::stringstream ss;

        auto uptime = getUptime();
        auto hours = std::chrono::duration_cast<std::chrono::hours>(uptime).count();
        auto minutes = std::chrono::duration_cast<std::chrono::minutes>(uptime % std::chrono::hours(1)).count();

        auto t = getTransferMetrics();
        auto s = getSecurityMetrics();

        ss << "=== CubeLink Metrics Summary ===" << std::endl;
        ss << "Uptime: " << hours << "h " << minutes << "m" << std::endl << std::endl;

        ss << "--- Rooms ---" << std::endl;
        ss << "  Created: " << t.roomsCreated << std::endl;
        ss << "  Joined: " << t.roomsJoined << std::endl;
        ss << "  Left: " << t.roomsLeft << std::endl << std::endl;

        ss << "--- Transfers ---" << std::endl;
        ss << std::fixed << std::setprecision(2);
        ss << "  Started: " << t.transfersStarted << std::endl;
        ss << "  Completed: " << t.transfersCompleted << std::endl;
        ss << "  Failed: " << t.transfersFailed << std::endl;
        ss << "  Cancelled: " << t.transfersCancelled << std::endl;
        ss << "  Sent: " << t.bytesSent / (1024.0 * 1024.0) << " MB" << std::endl;
        ss << "  Received: " << t.bytesReceived / (1024.0 * 1024.0) << " MB" << std::endl;
        ss << "  Checksum Mismatches: " << t.checksumMismatches << std::endl;
        ss << "  Avg Speed: " << t.avgTransferSpeedKBps << " KB/s" << std::endl << std::endl;

        ss << "--- Security ---" << std::endl;
        ss << "  Encryption Errors: " << s.encryptionErrors << std::endl;
        ss << "  Decryption Errors: " << s.decryptionErrors << std::endl;
        ss << "  Key Exchanges: " << s.keyExchanges << std::endl;

        return ss.str();
    }

    std::string MetricsCollector::exportPrometheus() const {
        std::stringstream ss;
        auto t = getTransferMetrics();
        auto s = getSecurityMetrics();

        auto counter = [&ss](const std::string& name, const std::string& help, uint64_t value) {
            ss << "# HELP " << name << " " << help << "\n";
            ss << "# TYPE " << name << " counter\n";
            ss << name << " " << value << "\n";
        };

        counter("cubelink_rooms_created_total", "Rooms created", t.roomsCreated);
        counter("cubelink_rooms_joined_total", "Rooms joined", t.roomsJoined);
        counter("cubelink_rooms_left_total", "Rooms left", t.roomsLeft);
        counter("cubelink_transfers_started_total", "Transfers started", t.transfersStarted);
        counter("cubelink_transfers_completed_total", "Transfers completed", t.transfersCompleted);
        counter("cubelink_transfers_failed_total", "Transfers failed", t.transfersFailed);
        counter("cubelink_transfers_cancelled_total", "Transfers cancelled", t.transfersCancelled);
        counter("cubelink_bytes_sent_total", "Plaintext bytes sent", t.bytesSent);
        counter("cubelink_bytes_received_total", "Plaintext bytes received", t.bytesReceived);
        counter("cubelink_checksum_mismatches_total", "Transfers failed on checksum", t.checksumMismatches);
        counter("cubelink_encryption_errors_total", "Chunk encryption failures", s.encryptionErrors);
        counter("cubelink_decryption_errors_total", "Chunk authentication failures", s.decryptionErrors);
        counter("cubelink_key_exchanges_total", "Session keys derived", s.keyExchanges);

        ss << "# HELP cubelink_transfer_speed_kbps Moving average transfer speed\n";
        ss << "# TYPE cubelink_transfer_speed_kbps gauge\n";
        ss << "cubelink_transfer_speed_kbps " << t.avgTransferSpeedKBps << "\n";

        ss << "# HELP cubelink_uptime_seconds Process uptime\n";
        ss << "# TYPE cubelink_uptime_seconds gauge\n";
        ss << "cubelink_uptime_seconds " << getUptime().count() << "\n";

        return ss.str();
    }

    void MetricsCollector::reset() {
        roomsCreated_ = 0;
        roomsJoined_ = 0;
        roomsLeft_ = 0;
        transfersStarted_ = 0;
        transfersCompleted_ = 0;
        transfersFailed_ = 0;
        transfersCancelled_ = 0;
        bytesSent_ = 0;
        bytesReceived_ = 0;
        checksumMismatches_ = 0;
        avgTransferSpeedKBps_ = 0;
        encryptionErrors_ = 0;
        decryptionErrors_ = 0;
        keyExchanges_ = 0;
    }

    std::chrono::seconds MetricsCollector::getUptime() const {
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now() - startTime_);
    }

} // namespace CubeLink

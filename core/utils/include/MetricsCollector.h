#pragma once

#include <string>
#include <atomic>
#include <chrono>
#include <cstdint>

namespace CubeLink {

    // Plain copy of the counters for reporting
    struct TransferMetricsSnapshot {
        uint64_t roomsCreated{0};
        uint64_t roomsJoined{0};
        uint64_t roomsLeft{0};
        uint64_t transfersStarted{0};
        uint64_t transfersCompleted{0};
        uint64_t transfersFailed{0};
        uint64_t transfersCancelled{0};
        uint64_t bytesSent{0};
        uint64_t bytesReceived{0};
        uint64_t checksumMismatches{0};
        uint64_t avgTransferSpeedKBps{0};
    };

    struct SecurityMetricsSnapshot {
        uint64_t encryptionErrors{0};
        uint64_t decryptionErrors{0};
        uint64_t keyExchanges{0};
    };

    class MetricsCollector {
    public:
        static MetricsCollector& instance();

        void incrementRoomsCreated() { roomsCreated_++; }
        void incrementRoomsJoined() { roomsJoined_++; }
        void incrementRoomsLeft() { roomsLeft_++; }

        void incrementTransfersStarted() { transfersStarted_++; }
        void incrementTransfersCompleted() { transfersCompleted_++; }
        void incrementTransfersFailed() { transfersFailed_++; }
        void incrementTransfersCancelled() { transfersCancelled_++; }
        void addBytesSent(uint64_t bytes) { bytesSent_ += bytes; }
        void addBytesReceived(uint64_t bytes) { bytesReceived_ += bytes; }
        void incrementChecksumMismatches() { checksumMismatches_++; }
        void recordTransferSpeed(uint64_t speedKBps);

        void incrementEncryptionErrors() { encryptionErrors_++; }
        void incrementDecryptionErrors() { decryptionErrors_++; }
        void incrementKeyExchanges() { keyExchanges_++; }

        TransferMetricsSnapshot getTransferMetrics() const;
        SecurityMetricsSnapshot getSecurityMetrics() const;

        std::string getMetricsSummary() const;
        std::string exportPrometheus() const;

        void reset();
        std::chrono::seconds getUptime() const;

    private:
        MetricsCollector();
        ~MetricsCollector() = default;

        std::atomic<uint64_t> roomsCreated_{0};
        std::atomic<uint64_t> roomsJoined_{0};
        std::atomic<uint64_t> roomsLeft_{0};
        std::atomic<uint64_t> transfersStarted_{0};
        std::atomic<uint64_t> transfersCompleted_{0};
        std::atomic<uint64_t> transfersFailed_{0};
        std::atomic<uint64_t> transfersCancelled_{0};
        std::atomic<uint64_t> bytesSent_{0};
        std::atomic<uint64_t> bytesReceived_{0};
        std::atomic<uint64_t> checksumMismatches_{0};
        std::atomic<uint64_t> avgTransferSpeedKBps_{0};
        std::atomic<uint64_t> encryptionErrors_{0};
        std::atomic<uint64_t> decryptionErrors_{0};
        std::atomic<uint64_t> keyExchanges_{0};

        std::chrono::system_clock::time_point startTime_;
    };

} // namespace CubeLink

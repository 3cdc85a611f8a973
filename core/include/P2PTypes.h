#pragma once

/**
 * @file P2PTypes.h
 * @brief Value types shared by the room, signaling and transfer components
 *
 * Timestamps are milliseconds since the Unix epoch. Every type serializes
 * to JSON with the field names used on the wire and in event payloads.
 */

#include "Result.h"
#include <json/json.h>
#include <cstdint>
#include <optional>
#include <string>

namespace CubeLink {

enum class TransferStatus {
    Pending,
    Connecting,
    Connected,
    Transferring,
    Completed,
    Failed,
    Cancelled
};

std::string toString(TransferStatus status);
bool isTerminal(TransferStatus status);

/**
 * @brief Whether a transfer may move from one status to another
 *
 * Legal moves are one step forward along
 * Pending -> Connecting -> Connected -> Transferring -> Completed, or from any
 * non-terminal status straight to Failed or Cancelled. Terminal statuses
 * never change.
 */
bool canTransition(TransferStatus from, TransferStatus to);

enum class SignalingState {
    Disconnected,
    Connecting,
    Connected,
    Error
};

std::string toString(SignalingState state);

struct FileMetadata {
    std::string name;
    uint64_t size{0};
    std::string mimeType;
    uint64_t chunks{0};
    std::string checksum;  // hex SHA-256

    Json::Value toJson() const;
    static Result<FileMetadata> fromJson(const Json::Value& json);
};

struct Room {
    std::string roomId;
    std::string roomCode;
    uint64_t createdAt{0};
    uint64_t expiresAt{0};
    bool isHost{false};
    size_t peerCount{0};
    size_t maxPeers{0};

    bool isExpired(uint64_t nowMs) const { return nowMs > expiresAt; }
    Json::Value toJson() const;
};

struct Transfer {
    std::string id;
    std::string roomId;
    FileMetadata metadata;
    TransferStatus status{TransferStatus::Pending};
    double progress{0.0};        // 0.0 - 100.0
    uint64_t bytesTransferred{0};
    uint64_t speed{0};           // bytes per second
    std::optional<uint64_t> startedAt;
    std::optional<uint64_t> completedAt;
    std::optional<std::string> error;
    bool isSender{false};

    Json::Value toJson() const;
};

struct Peer {
    std::string peerId;
    std::string roomId;
    bool connected{false};
    std::optional<uint64_t> connectedAt;
    uint64_t lastSeen{0};

    Json::Value toJson() const;
};

uint64_t nowMillis();

} // namespace CubeLink

#include "P2PTypes.h"
#include "ErrorCodes.h"
#include <chrono>

namespace CubeLink {

std::string toString(TransferStatus status) {
    switch (status) {
        case TransferStatus::Pending: return "pending";
        case TransferStatus::Connecting: return "connecting";
        case TransferStatus::Connected: return "connected";
        case TransferStatus::Transferring: return "transferring";
        case TransferStatus::Completed: return "completed";
        case TransferStatus::Failed: return "failed";
        case TransferStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

bool isTerminal(TransferStatus status) {
    return status == TransferStatus::Completed ||
           status == TransferStatus::Failed ||
           status == TransferStatus::Cancelled;
}

bool canTransition(TransferStatus from, TransferStatus to) {
    if (isTerminal(from)) {
        return false;
    }
    if (to == TransferStatus::Failed || to == TransferStatus::Cancelled) {
        return true;
    }
    return static_cast<int>(to) == static_cast<int>(from) + 1;
}

std::string toString(SignalingState state) {
    switch (state) {
        case SignalingState::Disconnected: return "disconnected";
        case SignalingState::Connecting: return "connecting";
        case SignalingState::Connected: return "connected";
        case SignalingState::Error: return "error";
    }
    return "unknown";
}

Json::Value FileMetadata::toJson() const {
    Json::Value json;
    json["name"] = name;
    json["size"] = Json::UInt64(size);
    json["mime_type"] = mimeType;
    json["chunks"] = Json::UInt64(chunks);
    json["checksum"] = checksum;
    return json;
}

Result<FileMetadata> FileMetadata::fromJson(const Json::Value& json) {
    if (!json.isObject() ||
        !json["name"].isString() ||
        !json["size"].isUInt64() ||
        !json["mime_type"].isString() ||
        !json["chunks"].isUInt64() ||
        !json["checksum"].isString()) {
        return makeError(ErrorCode::SIGNALING_PROTOCOL_ERROR, "malformed file metadata", "FileMetadata");
    }

    FileMetadata metadata;
    metadata.name = json["name"].asString();
    metadata.size = json["size"].asUInt64();
    metadata.mimeType = json["mime_type"].asString();
    metadata.chunks = json["chunks"].asUInt64();
    metadata.checksum = json["checksum"].asString();
    return metadata;
}

Json::Value Room::toJson() const {
    Json::Value json;
    json["room_id"] = roomId;
    json["room_code"] = roomCode;
    json["created_at"] = Json::UInt64(createdAt);
    json["expires_at"] = Json::UInt64(expiresAt);
    json["is_host"] = isHost;
    json["peer_count"] = Json::UInt64(peerCount);
    json["max_peers"] = Json::UInt64(maxPeers);
    return json;
}

namespace {

Json::Value optionalTime(const std::optional<uint64_t>& value) {
    return value ? Json::Value(Json::UInt64(*value)) : Json::Value(Json::nullValue);
}

} // namespace

Json::Value Transfer::toJson() const {
    Json::Value json;
    json["id"] = id;
    json["room_id"] = roomId;
    json["file_metadata"] = metadata.toJson();
    json["status"] = toString(status);
    json["progress"] = progress;
    json["bytes_transferred"] = Json::UInt64(bytesTransferred);
    json["speed"] = Json::UInt64(speed);
    json["started_at"] = optionalTime(startedAt);
    json["completed_at"] = optionalTime(completedAt);
    json["error"] = error ? Json::Value(*error) : Json::Value(Json::nullValue);
    json["is_sender"] = isSender;
    return json;
}

Json::Value Peer::toJson() const {
    Json::Value json;
    json["peer_id"] = peerId;
    json["room_id"] = roomId;
    json["connected"] = connected;
    json["connected_at"] = optionalTime(connectedAt);
    json["last_seen"] = Json::UInt64(lastSeen);
    return json;
}

uint64_t nowMillis() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

} // namespace CubeLink

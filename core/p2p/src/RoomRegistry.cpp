#include "RoomRegistry.h"
#include "AccessCode.h"
#include "ErrorCodes.h"
#include "IdGenerator.h"
#include "MetricsCollector.h"
#include "P2PEvents.h"
#include "LoggerMacros.h"

namespace CubeLink {

namespace {
const char* COMPONENT = "RoomRegistry";
}

RoomRegistry::RoomRegistry(const P2PSettings& settings, EventBus& eventBus, CodeGenerator generateCode)
    : settings_(settings)
    , eventBus_(eventBus)
    , generateCode_(generateCode ? std::move(generateCode) : CodeGenerator(&AccessCode::generate)) {}

Result<Room> RoomRegistry::createRoom(size_t maxPeers, const std::string& hostPeerId) {
    Room room;
    std::optional<Peer> hostPeer;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        uint64_t now = nowMillis();
        auto code = drawUnusedCode(now);
        if (!code) {
            LOG_ERROR_COMP("No unused access code after " +
                           std::to_string(settings_.codeMaxAttempts) + " attempts", COMPONENT);
            return makeError(ErrorCode::ROOM_CODE_EXHAUSTED, "", COMPONENT);
        }

        room.roomId = IdGenerator::uuid();
        room.roomCode = *code;
        room.createdAt = now;
        room.expiresAt = now + static_cast<uint64_t>(settings_.roomTtl.count()) * 1000;
        room.isHost = true;
        room.peerCount = 0;
        room.maxPeers = maxPeers > 0 ? maxPeers : settings_.defaultMaxPeers;

        rooms_[room.roomId] = room;
        codes_[room.roomCode] = room.roomId;

        if (!hostPeerId.empty()) {
            Peer peer{hostPeerId, room.roomId, true, now, now};
            peers_[room.roomId][hostPeerId] = peer;
            hostPeer = peer;
        }
    }

    MetricsCollector::instance().incrementRoomsCreated();
    Logger::instance().info("Created room " + room.roomId + " (code " +
                            AccessCode::format(room.roomCode) + ")", COMPONENT);
    eventBus_.publish(events::ROOM_CREATED, room);
    if (hostPeer) {
        eventBus_.publish(events::PEER_JOINED, *hostPeer);
    }
    return room;
}

Result<Room> RoomRegistry::joinRoom(const std::string& accessCode, const std::string& peerId) {
    const std::string code = AccessCode::normalize(accessCode);

    Room room;
    std::optional<Peer> joined;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto codeIt = codes_.find(code);
        if (codeIt == codes_.end()) {
            return makeError(ErrorCode::ROOM_NOT_FOUND, "no room with code " + code, COMPONENT);
        }

        Room& stored = rooms_.at(codeIt->second);
        if (stored.peerCount >= stored.maxPeers) {
            return makeError(ErrorCode::ROOM_FULL, stored.roomId, COMPONENT);
        }

        uint64_t now = nowMillis();
        if (stored.isExpired(now)) {
            return makeError(ErrorCode::ROOM_EXPIRED, stored.roomId, COMPONENT);
        }

        stored.peerCount++;
        room = stored;
        room.isHost = false;

        if (!peerId.empty()) {
            Peer peer{peerId, room.roomId, true, now, now};
            peers_[room.roomId][peerId] = peer;
            joined = peer;
        }
    }

    MetricsCollector::instance().incrementRoomsJoined();
    Logger::instance().info("Joined room " + room.roomId + " (" +
                            std::to_string(room.peerCount) + "/" +
                            std::to_string(room.maxPeers) + ")", COMPONENT);
    eventBus_.publish(events::ROOM_JOINED, room);
    if (joined) {
        eventBus_.publish(events::PEER_JOINED, *joined);
    }
    return room;
}

bool RoomRegistry::leaveRoom(const std::string& roomId) {
    Room removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = rooms_.find(roomId);
        if (it == rooms_.end()) {
            return false;
        }
        removed = it->second;
        eraseRoomLocked(roomId);
    }

    MetricsCollector::instance().incrementRoomsLeft();
    Logger::instance().info("Left room " + roomId, COMPONENT);
    eventBus_.publish(events::ROOM_LEFT, removed);
    return true;
}

VoidResult RoomRegistry::departPeer(const std::string& roomId, const std::string& peerId) {
    Room snapshot;
    std::optional<Peer> departed;
    bool destroyed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = rooms_.find(roomId);
        if (it == rooms_.end()) {
            return makeError(ErrorCode::ROOM_NOT_FOUND, roomId, COMPONENT);
        }

        auto rosterIt = peers_.find(roomId);
        if (rosterIt != peers_.end()) {
            auto peerIt = rosterIt->second.find(peerId);
            if (peerIt != rosterIt->second.end()) {
                departed = peerIt->second;
                departed->connected = false;
                rosterIt->second.erase(peerIt);
            }
        }

        Room& stored = it->second;
        if (stored.peerCount > 0) {
            stored.peerCount--;
        }
        snapshot = stored;

        if (stored.peerCount == 0) {
            eraseRoomLocked(roomId);
            destroyed = true;
        }
    }

    if (departed) {
        eventBus_.publish(events::PEER_LEFT, *departed);
    }
    if (destroyed) {
        MetricsCollector::instance().incrementRoomsLeft();
        Logger::instance().info("Last peer left room " + roomId + ", room closed", COMPONENT);
        eventBus_.publish(events::ROOM_LEFT, snapshot);
    }
    return Ok();
}

std::optional<Room> RoomRegistry::getRoom(const std::string& roomId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rooms_.find(roomId);
    if (it == rooms_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Room> RoomRegistry::findByCode(const std::string& accessCode) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = codes_.find(AccessCode::normalize(accessCode));
    if (it == codes_.end()) {
        return std::nullopt;
    }
    return rooms_.at(it->second);
}

std::vector<Room> RoomRegistry::listRooms() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Room> rooms;
    rooms.reserve(rooms_.size());
    for (const auto& [id, room] : rooms_) {
        rooms.push_back(room);
    }
    return rooms;
}

bool RoomRegistry::hasRoom(const std::string& roomId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rooms_.count(roomId) > 0;
}

size_t RoomRegistry::purgeExpired() {
    std::vector<Room> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        uint64_t now = nowMillis();
        for (const auto& [id, room] : rooms_) {
            if (room.isExpired(now)) {
                expired.push_back(room);
            }
        }
        for (const auto& room : expired) {
            eraseRoomLocked(room.roomId);
        }
    }

    for (const auto& room : expired) {
        LOG_DEBUG_COMP_IF("Purged expired room " + room.roomId, COMPONENT);
        eventBus_.publish(events::ROOM_LEFT, room);
    }
    return expired.size();
}

VoidResult RoomRegistry::addPeer(const std::string& roomId, const std::string& peerId) {
    Peer peer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (rooms_.count(roomId) == 0) {
            return makeError(ErrorCode::ROOM_NOT_FOUND, roomId, COMPONENT);
        }

        auto& roster = peers_[roomId];
        auto it = roster.find(peerId);
        uint64_t now = nowMillis();
        if (it != roster.end()) {
            it->second.connected = true;
            it->second.lastSeen = now;
            return Ok();
        }

        peer = Peer{peerId, roomId, true, now, now};
        roster[peerId] = peer;
    }

    eventBus_.publish(events::PEER_JOINED, peer);
    return Ok();
}

bool RoomRegistry::removePeer(const std::string& roomId, const std::string& peerId) {
    Peer peer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto rosterIt = peers_.find(roomId);
        if (rosterIt == peers_.end()) {
            return false;
        }
        auto it = rosterIt->second.find(peerId);
        if (it == rosterIt->second.end()) {
            return false;
        }
        peer = it->second;
        peer.connected = false;
        rosterIt->second.erase(it);
    }

    eventBus_.publish(events::PEER_LEFT, peer);
    return true;
}

bool RoomRegistry::markPeerSeen(const std::string& roomId, const std::string& peerId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto rosterIt = peers_.find(roomId);
    if (rosterIt == peers_.end()) {
        return false;
    }
    auto it = rosterIt->second.find(peerId);
    if (it == rosterIt->second.end()) {
        return false;
    }
    it->second.lastSeen = nowMillis();
    return true;
}

std::vector<Peer> RoomRegistry::listPeers(const std::string& roomId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Peer> peers;
    auto it = peers_.find(roomId);
    if (it != peers_.end()) {
        for (const auto& [id, peer] : it->second) {
            peers.push_back(peer);
        }
    }
    return peers;
}

std::optional<std::string> RoomRegistry::drawUnusedCode(uint64_t now) {
    for (int attempt = 0; attempt < settings_.codeMaxAttempts; ++attempt) {
        std::string code = generateCode_();

        auto it = codes_.find(code);
        if (it == codes_.end()) {
            return code;
        }

        // An expired room gives up its code
        auto roomIt = rooms_.find(it->second);
        if (roomIt == rooms_.end() || roomIt->second.isExpired(now)) {
            std::string staleRoomId = it->second;
            LOG_DEBUG_COMP_IF("Reclaiming access code from expired room " + staleRoomId, COMPONENT);
            codes_.erase(it);
            eraseRoomLocked(staleRoomId);
            return code;
        }
    }
    return std::nullopt;
}

void RoomRegistry::eraseRoomLocked(const std::string& roomId) {
    auto it = rooms_.find(roomId);
    if (it != rooms_.end()) {
        auto codeIt = codes_.find(it->second.roomCode);
        if (codeIt != codes_.end() && codeIt->second == roomId) {
            codes_.erase(codeIt);
        }
        rooms_.erase(it);
    }
    peers_.erase(roomId);
}

} // namespace CubeLink

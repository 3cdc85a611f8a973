#pragma once

#include "EventBus.h"
#include "P2PSettings.h"
#include "P2PTypes.h"
#include "Result.h"
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace CubeLink {

    /**
     * @brief Rooms, their access codes and the per-room peer roster.
     *
     * All maps are guarded by one mutex that is held only for the map
     * operation itself; events are published after it is released with a
     * copy of the affected Room or Peer.
     *
     * Expiry is lazy: join checks it, and purgeExpired() sweeps on demand.
     */
    class RoomRegistry {
    public:
        // Draws one candidate access code
        using CodeGenerator = std::function<std::string()>;

        /**
         * @param generateCode Candidate code source; null selects
         *        AccessCode::generate.
         */
        RoomRegistry(const P2PSettings& settings, EventBus& eventBus, CodeGenerator generateCode = nullptr);

        /**
         * @brief Create a room owned by this side.
         * @param maxPeers Capacity; 0 selects room.default_max_peers.
         * @param hostPeerId Added to the roster when non-empty.
         * @return The new Room (peer_count 0, is_host true), or
         *         ROOM_CODE_EXHAUSTED if no unused access code could be drawn.
         */
        Result<Room> createRoom(size_t maxPeers, const std::string& hostPeerId = "");

        /**
         * @brief Join the room holding an access code.
         *
         * Checks run in order: unknown code (ROOM_NOT_FOUND), full
         * (ROOM_FULL), expired (ROOM_EXPIRED). On success peer_count is
         * incremented and the joiner's copy is returned with is_host false.
         */
        Result<Room> joinRoom(const std::string& accessCode, const std::string& peerId = "");

        /**
         * @brief Destroy a room for every participant.
         * @return false if no such room existed.
         */
        bool leaveRoom(const std::string& roomId);

        /**
         * @brief One peer leaves; the room is destroyed once nobody is left.
         */
        VoidResult departPeer(const std::string& roomId, const std::string& peerId);

        std::optional<Room> getRoom(const std::string& roomId) const;
        std::optional<Room> findByCode(const std::string& accessCode) const;
        std::vector<Room> listRooms() const;
        bool hasRoom(const std::string& roomId) const;

        // Remove every expired room; returns how many were removed
        size_t purgeExpired();

        VoidResult addPeer(const std::string& roomId, const std::string& peerId);
        bool removePeer(const std::string& roomId, const std::string& peerId);
        bool markPeerSeen(const std::string& roomId, const std::string& peerId);
        std::vector<Peer> listPeers(const std::string& roomId) const;

    private:
        // Caller holds mutex_
        std::optional<std::string> drawUnusedCode(uint64_t now);
        void eraseRoomLocked(const std::string& roomId);

        P2PSettings settings_;
        EventBus& eventBus_;
        CodeGenerator generateCode_;

        mutable std::mutex mutex_;
        std::unordered_map<std::string, Room> rooms_;                  // room_id -> room
        std::unordered_map<std::string, std::string> codes_;           // access code -> room_id
        std::unordered_map<std::string, std::unordered_map<std::string, Peer>> peers_;  // room_id -> roster
    };

} // namespace CubeLink

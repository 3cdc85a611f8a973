#pragma once

#include "EventBus.h"
#include "IDataChannel.h"
#include "ISignalingTransport.h"
#include "KeyAgreement.h"
#include "P2PSettings.h"
#include "P2PTypes.h"
#include "Result.h"
#include "RoomRegistry.h"
#include "SignalingCoordinator.h"
#include "TransferManager.h"
#include <json/json.h>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace CubeLink {

    /**
     * @brief Entry point of the P2P file-transfer subsystem.
     *
     * Owns the signaling coordinator, the room registry, the process key
     * pair and the transfer manager, and wires inbound signaling to them:
     *
     * - join_room / peer_joined / room_info  -> room roster
     * - leave_room / peer_left               -> RoomRegistry::departPeer
     * - key_exchange                         -> chunk key for the room
     * - file_offer                           -> TransferManager::registerIncoming
     *
     * Creating a room draws a random chunk key for it. Joining a room
     * announces this side's public key; the host answers each announcement
     * with the room key wrapped for that joiner (see KeyAgreement), so every
     * member of the room shares one chunk key.
     */
    class P2PService {
    public:
        /**
         * @param transport Opens outbound data channels; may be null.
         * @param signalingTransport Socket to the signaling server; null
         *        selects delegated mode.
         * @param rooms Registry to share with other services in the process;
         *        null creates a private one.
         */
        P2PService(const P2PSettings& settings,
                   EventBus& eventBus,
                   std::shared_ptr<ITransport> transport,
                   std::shared_ptr<ISignalingTransport> signalingTransport = nullptr,
                   std::shared_ptr<RoomRegistry> rooms = nullptr);
        ~P2PService();

        P2PService(const P2PService&) = delete;
        P2PService& operator=(const P2PService&) = delete;

        // Connects signaling
        VoidResult start();

        // Cancels unfinished transfers, joins their tasks, disconnects signaling
        void shutdown();

        VoidResult connectSignaling() { return signaling_->connect(); }
        void disconnectSignaling() { signaling_->disconnect(); }
        SignalingState signalingState() const { return signaling_->state(); }
        const std::string& localPeerId() const { return signaling_->localPeerId(); }
        const std::string& signalingServer() const { return signaling_->signalingServer(); }
        Json::Value iceServers() const { return signaling_->iceServers(); }

        Result<Room> createRoom(size_t maxPeers);
        Result<Room> joinRoom(const std::string& accessCode);
        bool leaveRoom(const std::string& roomId);
        std::optional<Room> getRoom(const std::string& roomId) const { return rooms_->getRoom(roomId); }
        std::vector<Room> listRooms() const { return rooms_->listRooms(); }
        size_t purgeExpiredRooms() { return rooms_->purgeExpired(); }

        Result<std::string> sendFile(const std::string& roomId, const std::string& path);
        VoidResult receiveFile(const std::string& transferId, const std::string& savePath);
        VoidResult cancelTransfer(const std::string& transferId);
        std::optional<Transfer> getTransfer(const std::string& transferId) const;
        std::vector<Transfer> listTransfers() const;

        // Entry point for channels opened by a remote sender
        VoidResult acceptDataChannel(const std::string& transferId, std::shared_ptr<IDataChannel> channel);

        SignalingCoordinator& signaling() { return *signaling_; }
        RoomRegistry& rooms() { return *rooms_; }
        TransferManager& transfers() { return *transfers_; }
        const KeyAgreement& keys() const { return keys_; }

    private:
        void handleSignal(const SignalingMessage& message);
        void handleKeyExchange(const SignalingMessage& message);
        void answerKeyAnnouncement(const SignalingMessage& message);
        void acceptRoomKey(const SignalingMessage& message);
        void announceKey(const std::string& roomId);
        void forgetRoom(const std::string& roomId);
        void sendSignal(const SignalingMessage& message);

        P2PSettings settings_;
        EventBus& eventBus_;
        KeyAgreement keys_;
        std::shared_ptr<RoomRegistry> rooms_;
        std::unique_ptr<SignalingCoordinator> signaling_;
        std::unique_ptr<TransferManager> transfers_;

        std::mutex keyMutex_;
        std::unordered_map<std::string, std::vector<uint8_t>> hostedKeys_;  // room_id -> room key
        std::unordered_set<std::string> joinedRooms_;
    };

} // namespace CubeLink

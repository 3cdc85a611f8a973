#include "P2PService.h"
#include "Crypto.h"
#include "ErrorCodes.h"
#include "LoggerMacros.h"

namespace CubeLink {

namespace {
const char* COMPONENT = "P2PService";
}

P2PService::P2PService(const P2PSettings& settings,
                       EventBus& eventBus,
                       std::shared_ptr<ITransport> transport,
                       std::shared_ptr<ISignalingTransport> signalingTransport,
                       std::shared_ptr<RoomRegistry> rooms)
    : settings_(settings)
    , eventBus_(eventBus)
    , rooms_(rooms ? std::move(rooms) : std::make_shared<RoomRegistry>(settings, eventBus))
    , signaling_(std::make_unique<SignalingCoordinator>(settings, eventBus, std::move(signalingTransport)))
    , transfers_(std::make_unique<TransferManager>(settings, eventBus, *rooms_, std::move(transport))) {
    signaling_->onMessage([this](const SignalingMessage& message) {
        handleSignal(message);
    });
}

P2PService::~P2PService() {
    shutdown();
}

VoidResult P2PService::start() {
    auto connected = signaling_->connect();
    if (!connected) {
        return connected;
    }
    Logger::instance().info("P2P service started as " + localPeerId(), COMPONENT);
    return Ok();
}

void P2PService::shutdown() {
    transfers_->shutdown();
    signaling_->disconnect();
}

Result<Room> P2PService::createRoom(size_t maxPeers) {
    auto room = rooms_->createRoom(maxPeers, localPeerId());
    if (!room) {
        return room;
    }
    const std::string& roomId = room.value().roomId;

    std::vector<uint8_t> roomKey = Crypto::generateKey();
    auto installed = transfers_->installSessionKey(roomId, roomKey);
    if (!installed) {
        Crypto::secureClear(roomKey);
        rooms_->leaveRoom(roomId);
        return installed.error();
    }
    {
        std::lock_guard<std::mutex> lock(keyMutex_);
        hostedKeys_[roomId] = std::move(roomKey);
    }

    sendSignal(SignalingMessage::joinRoom(roomId, localPeerId()));
    return room;
}

Result<Room> P2PService::joinRoom(const std::string& accessCode) {
    auto room = rooms_->joinRoom(accessCode, localPeerId());
    if (room) {
        const std::string& roomId = room.value().roomId;
        {
            std::lock_guard<std::mutex> lock(keyMutex_);
            joinedRooms_.insert(roomId);
        }
        sendSignal(SignalingMessage::joinRoom(roomId, localPeerId()));
        announceKey(roomId);
    }
    return room;
}

bool P2PService::leaveRoom(const std::string& roomId) {
    if (!rooms_->leaveRoom(roomId)) {
        return false;
    }
    forgetRoom(roomId);
    sendSignal(SignalingMessage::leaveRoom(roomId, localPeerId()));
    return true;
}

Result<std::string> P2PService::sendFile(const std::string& roomId, const std::string& path) {
    // The offer has to reach the room before the data channel opens
    return transfers_->sendFile(roomId, path, [this](const Transfer& transfer) {
        sendSignal(SignalingMessage::fileOffer(transfer.roomId, localPeerId(), transfer.id, transfer.metadata));
    });
}

VoidResult P2PService::receiveFile(const std::string& transferId, const std::string& savePath) {
    return transfers_->receiveFile(transferId, savePath);
}

VoidResult P2PService::cancelTransfer(const std::string& transferId) {
    return transfers_->cancelTransfer(transferId);
}

std::optional<Transfer> P2PService::getTransfer(const std::string& transferId) const {
    return transfers_->getTransfer(transferId);
}

std::vector<Transfer> P2PService::listTransfers() const {
    return transfers_->listTransfers();
}

VoidResult P2PService::acceptDataChannel(const std::string& transferId, std::shared_ptr<IDataChannel> channel) {
    return transfers_->attachInboundChannel(transferId, std::move(channel));
}

void P2PService::handleSignal(const SignalingMessage& message) {
    using Type = SignalingMessage::Type;

    if (!message.roomId.empty() && !message.sender().empty()) {
        rooms_->markPeerSeen(message.roomId, message.sender());
    }

    switch (message.type) {
        case Type::JoinRoom:
        case Type::PeerJoined:
            if (rooms_->hasRoom(message.roomId)) {
                rooms_->addPeer(message.roomId, message.peerId).onError([](const Error& error) {
                    LOG_DEBUG_COMP_IF("Roster update skipped: " + error.message, COMPONENT);
                });
            }
            break;

        case Type::LeaveRoom:
        case Type::PeerLeft:
            rooms_->departPeer(message.roomId, message.peerId).onError([](const Error& error) {
                LOG_DEBUG_COMP_IF("Departure ignored: " + error.message, COMPONENT);
            });
            if (!rooms_->hasRoom(message.roomId)) {
                forgetRoom(message.roomId);
            }
            break;

        case Type::RoomInfo:
            if (rooms_->hasRoom(message.roomId)) {
                for (const auto& peer : message.peers) {
                    if (peer == localPeerId()) {
                        continue;
                    }
                    rooms_->addPeer(message.roomId, peer).onError([](const Error& error) {
                        LOG_DEBUG_COMP_IF("Roster update skipped: " + error.message, COMPONENT);
                    });
                }
            }
            break;

        case Type::KeyExchange:
            handleKeyExchange(message);
            break;

        case Type::FileOffer:
            transfers_->registerIncoming(message.roomId, message.transferId, message.metadata)
                .onError([&message](const Error& error) {
                    LOG_WARN_COMP("Rejected file offer " + message.transferId + ": " + error.message, COMPONENT);
                });
            break;

        default:
            break;
    }
}

void P2PService::handleKeyExchange(const SignalingMessage& message) {
    if (!message.to.empty() && message.to != localPeerId()) {
        return;
    }
    if (!rooms_->hasRoom(message.roomId)) {
        LOG_DEBUG_COMP_IF("Key for unknown room " + message.roomId + " ignored", COMPONENT);
        return;
    }

    if (message.wrappedKey.empty()) {
        answerKeyAnnouncement(message);
    } else {
        acceptRoomKey(message);
    }
}

void P2PService::answerKeyAnnouncement(const SignalingMessage& message) {
    std::vector<uint8_t> roomKey;
    {
        std::lock_guard<std::mutex> lock(keyMutex_);
        auto it = hostedKeys_.find(message.roomId);
        if (it == hostedKeys_.end()) {
            return;
        }
        roomKey = it->second;
    }

    // Every announcement is answered, so each joiner gets the key however late it arrives
    auto wrapped = keys_.wrapRoomKey(roomKey, message.publicKey, message.roomId, message.from);
    Crypto::secureClear(roomKey);
    if (!wrapped) {
        LOG_WARN_COMP("Key exchange with " + message.from + " failed: " + wrapped.error().message, COMPONENT);
        return;
    }

    sendSignal(SignalingMessage::keyExchange(message.roomId, localPeerId(), keys_.publicKeyHex(),
                                             message.from, wrapped.value()));
    LOG_DEBUG_COMP_IF("Room key for " + message.roomId + " sent to " + message.from, COMPONENT);
}

void P2PService::acceptRoomKey(const SignalingMessage& message) {
    {
        std::lock_guard<std::mutex> lock(keyMutex_);
        if (joinedRooms_.count(message.roomId) == 0) {
            LOG_DEBUG_COMP_IF("Room key for a room not joined ignored", COMPONENT);
            return;
        }
    }

    auto roomKey = keys_.unwrapRoomKey(message.wrappedKey, message.publicKey, message.roomId, localPeerId());
    if (!roomKey) {
        LOG_WARN_COMP("Room key from " + message.from + " rejected: " + roomKey.error().message, COMPONENT);
        return;
    }

    auto installed = transfers_->installSessionKey(message.roomId, roomKey.value());
    Crypto::secureClear(roomKey.value());
    if (!installed) {
        LOG_ERROR_COMP("Cannot install session key: " + installed.error().message, COMPONENT);
        return;
    }

    Logger::instance().info("Session key established for room " + message.roomId +
                            " with " + message.from, COMPONENT);
}

void P2PService::announceKey(const std::string& roomId) {
    sendSignal(SignalingMessage::keyExchange(roomId, localPeerId(), keys_.publicKeyHex()));
}

void P2PService::forgetRoom(const std::string& roomId) {
    {
        std::lock_guard<std::mutex> lock(keyMutex_);
        auto it = hostedKeys_.find(roomId);
        if (it != hostedKeys_.end()) {
            Crypto::secureClear(it->second);
            hostedKeys_.erase(it);
        }
        joinedRooms_.erase(roomId);
    }
    transfers_->removeSessionKey(roomId);
}

void P2PService::sendSignal(const SignalingMessage& message) {
    signaling_->send(message).onError([&message](const Error& error) {
        LOG_DEBUG_COMP_IF("Signal " + SignalingMessage::typeName(message.type) +
                          " not sent: " + error.message, COMPONENT);
    });
}

} // namespace CubeLink

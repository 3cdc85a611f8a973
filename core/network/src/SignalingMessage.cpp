#include "SignalingMessage.h"
#include "ErrorCodes.h"
#include <memory>
#include <sstream>
#include <unordered_map>

namespace CubeLink {

namespace {

const char* COMPONENT = "Signaling";

Error protocolError(const std::string& details) {
    return makeError(ErrorCode::SIGNALING_PROTOCOL_ERROR, details, COMPONENT);
}

bool readString(const Json::Value& json, const char* field, std::string& out) {
    const Json::Value& value = json[field];
    if (!value.isString()) {
        return false;
    }
    out = value.asString();
    return true;
}

} // namespace

std::string SignalingMessage::typeName(Type type) {
    switch (type) {
        case Type::JoinRoom: return "join_room";
        case Type::LeaveRoom: return "leave_room";
        case Type::Offer: return "offer";
        case Type::Answer: return "answer";
        case Type::IceCandidate: return "ice_candidate";
        case Type::PeerJoined: return "peer_joined";
        case Type::PeerLeft: return "peer_left";
        case Type::RoomInfo: return "room_info";
        case Type::Error: return "error";
        case Type::KeyExchange: return "key_exchange";
        case Type::FileOffer: return "file_offer";
    }
    return "unknown";
}

SignalingMessage SignalingMessage::joinRoom(const std::string& roomId, const std::string& peerId) {
    SignalingMessage msg;
    msg.type = Type::JoinRoom;
    msg.roomId = roomId;
    msg.peerId = peerId;
    return msg;
}

SignalingMessage SignalingMessage::leaveRoom(const std::string& roomId, const std::string& peerId) {
    SignalingMessage msg = joinRoom(roomId, peerId);
    msg.type = Type::LeaveRoom;
    return msg;
}

SignalingMessage SignalingMessage::peerJoined(const std::string& roomId, const std::string& peerId) {
    SignalingMessage msg = joinRoom(roomId, peerId);
    msg.type = Type::PeerJoined;
    return msg;
}

SignalingMessage SignalingMessage::peerLeft(const std::string& roomId, const std::string& peerId) {
    SignalingMessage msg = joinRoom(roomId, peerId);
    msg.type = Type::PeerLeft;
    return msg;
}

SignalingMessage SignalingMessage::offer(const std::string& roomId, const std::string& from,
                                         const std::string& to, const std::string& sdp) {
    SignalingMessage msg;
    msg.type = Type::Offer;
    msg.roomId = roomId;
    msg.from = from;
    msg.to = to;
    msg.sdp = sdp;
    return msg;
}

SignalingMessage SignalingMessage::answer(const std::string& roomId, const std::string& from,
                                          const std::string& to, const std::string& sdp) {
    SignalingMessage msg = offer(roomId, from, to, sdp);
    msg.type = Type::Answer;
    return msg;
}

SignalingMessage SignalingMessage::iceCandidate(const std::string& roomId, const std::string& from,
                                                const std::string& to, const std::string& candidate) {
    SignalingMessage msg;
    msg.type = Type::IceCandidate;
    msg.roomId = roomId;
    msg.from = from;
    msg.to = to;
    msg.candidate = candidate;
    return msg;
}

SignalingMessage SignalingMessage::roomInfo(const std::string& roomId, const std::vector<std::string>& peers) {
    SignalingMessage msg;
    msg.type = Type::RoomInfo;
    msg.roomId = roomId;
    msg.peers = peers;
    return msg;
}

SignalingMessage SignalingMessage::error(const std::string& message) {
    SignalingMessage msg;
    msg.type = Type::Error;
    msg.message = message;
    return msg;
}

SignalingMessage SignalingMessage::keyExchange(const std::string& roomId, const std::string& from,
                                               const std::string& publicKeyHex,
                                               const std::string& to,
                                               const std::string& wrappedKeyHex) {
    SignalingMessage msg;
    msg.type = Type::KeyExchange;
    msg.roomId = roomId;
    msg.from = from;
    msg.to = to;
    msg.publicKey = publicKeyHex;
    msg.wrappedKey = wrappedKeyHex;
    return msg;
}

SignalingMessage SignalingMessage::fileOffer(const std::string& roomId, const std::string& from,
                                             const std::string& transferId, const FileMetadata& metadata) {
    SignalingMessage msg;
    msg.type = Type::FileOffer;
    msg.roomId = roomId;
    msg.from = from;
    msg.transferId = transferId;
    msg.metadata = metadata;
    return msg;
}

const std::string& SignalingMessage::sender() const {
    return from.empty() ? peerId : from;
}

Json::Value SignalingMessage::toJson() const {
    Json::Value json;
    json["type"] = typeName(type);

    switch (type) {
        case Type::JoinRoom:
        case Type::LeaveRoom:
        case Type::PeerJoined:
        case Type::PeerLeft:
            json["room_id"] = roomId;
            json["peer_id"] = peerId;
            break;
        case Type::Offer:
        case Type::Answer:
            json["room_id"] = roomId;
            json["from"] = from;
            json["to"] = to;
            json["sdp"] = sdp;
            break;
        case Type::IceCandidate:
            json["room_id"] = roomId;
            json["from"] = from;
            json["to"] = to;
            json["candidate"] = candidate;
            break;
        case Type::RoomInfo: {
            json["room_id"] = roomId;
            Json::Value list(Json::arrayValue);
            for (const auto& peer : peers) {
                list.append(peer);
            }
            json["peers"] = list;
            break;
        }
        case Type::Error:
            json["message"] = message;
            break;
        case Type::KeyExchange:
            json["room_id"] = roomId;
            json["from"] = from;
            json["public_key"] = publicKey;
            if (!to.empty()) {
                json["to"] = to;
            }
            if (!wrappedKey.empty()) {
                json["wrapped_key"] = wrappedKey;
            }
            break;
        case Type::FileOffer:
            json["room_id"] = roomId;
            json["from"] = from;
            json["transfer_id"] = transferId;
            json["metadata"] = metadata.toJson();
            break;
    }
    return json;
}

std::string SignalingMessage::serialize() const {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, toJson());
}

Result<SignalingMessage> SignalingMessage::parse(const std::string& text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        return protocolError("invalid JSON: " + errors);
    }
    return fromJson(root);
}

Result<SignalingMessage> SignalingMessage::fromJson(const Json::Value& json) {
    static const std::unordered_map<std::string, Type> types = {
        {"join_room", Type::JoinRoom},
        {"leave_room", Type::LeaveRoom},
        {"offer", Type::Offer},
        {"answer", Type::Answer},
        {"ice_candidate", Type::IceCandidate},
        {"peer_joined", Type::PeerJoined},
        {"peer_left", Type::PeerLeft},
        {"room_info", Type::RoomInfo},
        {"error", Type::Error},
        {"key_exchange", Type::KeyExchange},
        {"file_offer", Type::FileOffer}
    };

    if (!json.isObject() || !json["type"].isString()) {
        return protocolError("missing message type");
    }

    auto it = types.find(json["type"].asString());
    if (it == types.end()) {
        return protocolError("unknown message type '" + json["type"].asString() + "'");
    }

    SignalingMessage msg;
    msg.type = it->second;
    bool ok = true;

    switch (msg.type) {
        case Type::JoinRoom:
        case Type::LeaveRoom:
        case Type::PeerJoined:
        case Type::PeerLeft:
            ok = readString(json, "room_id", msg.roomId) &&
                 readString(json, "peer_id", msg.peerId);
            break;
        case Type::Offer:
        case Type::Answer:
            ok = readString(json, "room_id", msg.roomId) &&
                 readString(json, "from", msg.from) &&
                 readString(json, "to", msg.to) &&
                 readString(json, "sdp", msg.sdp);
            break;
        case Type::IceCandidate:
            ok = readString(json, "room_id", msg.roomId) &&
                 readString(json, "from", msg.from) &&
                 readString(json, "to", msg.to) &&
                 readString(json, "candidate", msg.candidate);
            break;
        case Type::RoomInfo:
            ok = readString(json, "room_id", msg.roomId) && json["peers"].isArray();
            if (ok) {
                for (const auto& peer : json["peers"]) {
                    if (!peer.isString()) {
                        ok = false;
                        break;
                    }
                    msg.peers.push_back(peer.asString());
                }
            }
            break;
        case Type::Error:
            ok = readString(json, "message", msg.message);
            break;
        case Type::KeyExchange:
            ok = readString(json, "room_id", msg.roomId) &&
                 readString(json, "from", msg.from) &&
                 readString(json, "public_key", msg.publicKey) &&
                 (!json.isMember("to") || readString(json, "to", msg.to)) &&
                 (!json.isMember("wrapped_key") || readString(json, "wrapped_key", msg.wrappedKey));
            break;
        case Type::FileOffer: {
            ok = readString(json, "room_id", msg.roomId) &&
                 readString(json, "from", msg.from) &&
                 readString(json, "transfer_id", msg.transferId);
            if (ok) {
                auto metadata = FileMetadata::fromJson(json["metadata"]);
                if (!metadata) {
                    return metadata.error();
                }
                msg.metadata = metadata.value();
            }
            break;
        }
    }

    if (!ok) {
        return protocolError("missing or invalid fields in '" + typeName(msg.type) + "'");
    }
    return msg;
}

} // namespace CubeLink

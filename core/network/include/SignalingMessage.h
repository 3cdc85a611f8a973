#pragma once

#include "P2PTypes.h"
#include "Result.h"
#include <json/json.h>
#include <string>
#include <vector>

namespace CubeLink {

/**
 * @brief One message on the signaling channel
 *
 * Serialized as a JSON object whose "type" field (snake_case) selects which
 * of the other fields are present:
 *
 *   join_room / leave_room / peer_joined / peer_left   room_id, peer_id
 *   offer / answer                                     room_id, from, to, sdp
 *   ice_candidate                                      room_id, from, to, candidate
 *   room_info                                          room_id, peers
 *   error                                              message
 *   key_exchange                                       room_id, from, public_key,
 *                                                      [to, wrapped_key]
 *   file_offer                                         room_id, from, transfer_id, metadata
 */
struct SignalingMessage {
    enum class Type {
        JoinRoom,
        LeaveRoom,
        Offer,
        Answer,
        IceCandidate,
        PeerJoined,
        PeerLeft,
        RoomInfo,
        Error,
        KeyExchange,
        FileOffer
    };

    Type type{Type::Error};
    std::string roomId;
    std::string peerId;
    std::string from;
    std::string to;
    std::string sdp;
    std::string candidate;
    std::vector<std::string> peers;
    std::string message;
    std::string publicKey;  // hex
    std::string wrappedKey; // hex, room key sealed for "to"
    std::string transferId;
    FileMetadata metadata;

    static SignalingMessage joinRoom(const std::string& roomId, const std::string& peerId);
    static SignalingMessage leaveRoom(const std::string& roomId, const std::string& peerId);
    static SignalingMessage peerJoined(const std::string& roomId, const std::string& peerId);
    static SignalingMessage peerLeft(const std::string& roomId, const std::string& peerId);
    static SignalingMessage offer(const std::string& roomId, const std::string& from,
                                  const std::string& to, const std::string& sdp);
    static SignalingMessage answer(const std::string& roomId, const std::string& from,
                                   const std::string& to, const std::string& sdp);
    static SignalingMessage iceCandidate(const std::string& roomId, const std::string& from,
                                         const std::string& to, const std::string& candidate);
    static SignalingMessage roomInfo(const std::string& roomId, const std::vector<std::string>& peers);
    static SignalingMessage error(const std::string& message);
    // Without "to" this announces a joiner's key to the room; the host answers
    // with a directed key_exchange carrying the wrapped room key
    static SignalingMessage keyExchange(const std::string& roomId, const std::string& from,
                                        const std::string& publicKeyHex,
                                        const std::string& to = "",
                                        const std::string& wrappedKeyHex = "");
    static SignalingMessage fileOffer(const std::string& roomId, const std::string& from,
                                      const std::string& transferId, const FileMetadata& metadata);

    // Originating peer: "from" for directed messages, "peer_id" for roster messages
    const std::string& sender() const;

    Json::Value toJson() const;
    std::string serialize() const;

    /**
     * @brief Parse a message received from the wire
     * @return SIGNALING_PROTOCOL_ERROR for invalid JSON, unknown types or
     *         missing fields
     */
    static Result<SignalingMessage> parse(const std::string& text);
    static Result<SignalingMessage> fromJson(const Json::Value& json);

    static std::string typeName(Type type);
};

} // namespace CubeLink

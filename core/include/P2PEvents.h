#pragma once

/**
 * @file P2PEvents.h
 * @brief EventBus topics published by the P2P subsystem
 *
 * Room events carry a Room, transfer events a Transfer, peer events a Peer
 * (all by value in the std::any). Signaling events carry a Json::Value.
 */

namespace CubeLink::events {

constexpr const char* ROOM_CREATED = "p2p:room_created";
constexpr const char* ROOM_JOINED = "p2p:room_joined";
constexpr const char* ROOM_LEFT = "p2p:room_left";

constexpr const char* TRANSFER_CREATED = "p2p:transfer_created";
constexpr const char* TRANSFER_UPDATED = "p2p:transfer_updated";
constexpr const char* TRANSFER_PROGRESS = "p2p:transfer_progress";
constexpr const char* TRANSFER_COMPLETED = "p2p:transfer_completed";
constexpr const char* TRANSFER_FAILED = "p2p:transfer_failed";
constexpr const char* TRANSFER_CANCELLED = "p2p:transfer_cancelled";

constexpr const char* PEER_JOINED = "p2p:peer_joined";
constexpr const char* PEER_LEFT = "p2p:peer_left";

constexpr const char* SIGNALING_READY = "p2p:signaling_ready";
constexpr const char* SIGNALING_STATE = "p2p:signaling_state";

// WebRTC negotiation (offer/answer/ice_candidate) handed to the transport layer
constexpr const char* SIGNALING_MESSAGE = "p2p:signaling_message";

// Outbound signaling text when the presentation layer owns the socket
constexpr const char* SIGNALING_OUTBOUND = "p2p:signaling_outbound";

} // namespace CubeLink::events

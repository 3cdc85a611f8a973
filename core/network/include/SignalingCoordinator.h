#pragma once

#include "EventBus.h"
#include "ISignalingTransport.h"
#include "P2PSettings.h"
#include "P2PTypes.h"
#include "Result.h"
#include "SignalingMessage.h"
#include <json/json.h>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace CubeLink {

    /**
     * @brief Owns the link to the signaling server and the local identity.
     *
     * State moves Disconnected -> Connecting -> Connected (or Error) on
     * connect() and back to Disconnected on disconnect(); every change is
     * published as p2p:signaling_state.
     *
     * With a signaling transport the coordinator drives the connection
     * itself. Without one it works in delegated mode: connect() succeeds at
     * once, outbound messages are published as p2p:signaling_outbound and the
     * owner of the socket feeds inbound text through deliverInbound().
     */
    class SignalingCoordinator {
    public:
        using MessageHandler = std::function<void(const SignalingMessage&)>;

        SignalingCoordinator(const P2PSettings& settings,
                             EventBus& eventBus,
                             std::shared_ptr<ISignalingTransport> transport = nullptr);
        ~SignalingCoordinator();

        SignalingCoordinator(const SignalingCoordinator&) = delete;
        SignalingCoordinator& operator=(const SignalingCoordinator&) = delete;

        /**
         * @brief Connect to the signaling server.
         * Publishes p2p:signaling_ready on success.
         * @return SIGNALING_CONNECTION_FAILED if the transport cannot open.
         */
        VoidResult connect();

        void disconnect();

        SignalingState state() const;

        // Generated once per coordinator, e.g. peer_3f2a9c1d
        const std::string& localPeerId() const { return localPeerId_; }
        const std::string& signalingServer() const { return signalingServer_; }

        /**
         * @brief ICE configuration for the transport layer.
         * @return {"iceServers": [...]} with STUN entries first, then TURN
         *         entries with credentials.
         */
        Json::Value iceServers() const;

        /**
         * @brief Send a message to the room's peers.
         * @return SIGNALING_NOT_CONNECTED unless the state is Connected.
         */
        VoidResult send(const SignalingMessage& message);

        /**
         * @brief Register a handler for inbound messages from other peers.
         * Handlers run on the thread that delivers the message.
         */
        void onMessage(MessageHandler handler);

        /**
         * @brief Feed one inbound message (raw JSON text).
         * @return SIGNALING_PROTOCOL_ERROR if the text cannot be parsed.
         */
        VoidResult deliverInbound(const std::string& text);

    private:
        void setState(SignalingState state);

        EventBus& eventBus_;
        std::shared_ptr<ISignalingTransport> transport_;

        std::string localPeerId_;
        std::string signalingServer_;
        std::vector<std::string> stunServers_;
        std::vector<TurnServer> turnServers_;

        mutable std::mutex mutex_;
        SignalingState state_{SignalingState::Disconnected};
        std::vector<MessageHandler> handlers_;
    };

} // namespace CubeLink

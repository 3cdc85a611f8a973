#include "SignalingCoordinator.h"
#include "ErrorCodes.h"
#include "IdGenerator.h"
#include "P2PEvents.h"
#include "LoggerMacros.h"

namespace CubeLink {

namespace {
const char* COMPONENT = "Signaling";
}

SignalingCoordinator::SignalingCoordinator(const P2PSettings& settings,
                                           EventBus& eventBus,
                                           std::shared_ptr<ISignalingTransport> transport)
    : eventBus_(eventBus)
    , transport_(std::move(transport))
    , localPeerId_(IdGenerator::peerId())
    , signalingServer_(settings.signalingUrl)
    , stunServers_(settings.stunServers)
    , turnServers_(settings.turnServers) {}

SignalingCoordinator::~SignalingCoordinator() {
    if (transport_) {
        transport_->setMessageHandler(nullptr);
        transport_->close();
    }
}

VoidResult SignalingCoordinator::connect() {
    if (state() == SignalingState::Connected) {
        return Ok();
    }

    setState(SignalingState::Connecting);

    if (transport_) {
        transport_->setMessageHandler([this](const std::string& text) {
            auto result = deliverInbound(text);
            if (!result) {
                LOG_WARN_COMP("Dropped inbound message: " + result.error().message, COMPONENT);
            }
        });

        if (!transport_->open(signalingServer_)) {
            setState(SignalingState::Error);
            LOG_ERROR_COMP("Cannot reach signaling server " + signalingServer_, COMPONENT);
            return makeError(ErrorCode::SIGNALING_CONNECTION_FAILED, signalingServer_, COMPONENT);
        }
    }

    setState(SignalingState::Connected);

    auto& logger = Logger::instance();
    logger.info("Signaling server ready: " + signalingServer_, COMPONENT);
    logger.info("Local peer ID: " + localPeerId_, COMPONENT);

    Json::Value ready;
    ready["server"] = signalingServer_;
    ready["peer_id"] = localPeerId_;
    ready["ice_servers"] = iceServers();
    eventBus_.publish(events::SIGNALING_READY, ready);

    return Ok();
}

void SignalingCoordinator::disconnect() {
    if (state() == SignalingState::Disconnected) {
        return;
    }
    if (transport_) {
        transport_->close();
    }
    setState(SignalingState::Disconnected);
    Logger::instance().info("Disconnected from signaling server", COMPONENT);
}

SignalingState SignalingCoordinator::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

Json::Value SignalingCoordinator::iceServers() const {
    Json::Value servers(Json::arrayValue);

    for (const auto& stun : stunServers_) {
        Json::Value entry;
        entry["urls"] = stun;
        servers.append(entry);
    }

    for (const auto& turn : turnServers_) {
        Json::Value entry;
        entry["urls"] = turn.urls;
        entry["username"] = turn.username;
        entry["credential"] = turn.credential;
        servers.append(entry);
    }

    Json::Value config;
    config["iceServers"] = servers;
    return config;
}

VoidResult SignalingCoordinator::send(const SignalingMessage& message) {
    if (state() != SignalingState::Connected) {
        return makeError(ErrorCode::SIGNALING_NOT_CONNECTED,
                         SignalingMessage::typeName(message.type), COMPONENT);
    }

    std::string text = message.serialize();
    LOG_DEBUG_COMP_IF("-> " + text, COMPONENT);

    if (!transport_) {
        eventBus_.publish(events::SIGNALING_OUTBOUND, message.toJson());
        return Ok();
    }

    if (!transport_->send(text)) {
        LOG_WARN_COMP("Signaling send failed for " + SignalingMessage::typeName(message.type), COMPONENT);
        return makeError(ErrorCode::SIGNALING_CONNECTION_FAILED, "send failed", COMPONENT);
    }
    return Ok();
}

void SignalingCoordinator::onMessage(MessageHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.push_back(std::move(handler));
}

VoidResult SignalingCoordinator::deliverInbound(const std::string& text) {
    auto parsed = SignalingMessage::parse(text);
    if (!parsed) {
        return parsed.error();
    }

    const SignalingMessage& message = parsed.value();

    // Servers may echo our own messages back
    if (!message.sender().empty() && message.sender() == localPeerId_) {
        return Ok();
    }

    LOG_DEBUG_COMP_IF("<- " + text, COMPONENT);

    switch (message.type) {
        case SignalingMessage::Type::Offer:
        case SignalingMessage::Type::Answer:
        case SignalingMessage::Type::IceCandidate:
            eventBus_.publish(events::SIGNALING_MESSAGE, message.toJson());
            break;
        case SignalingMessage::Type::Error:
            LOG_WARN_COMP("Signaling server error: " + message.message, COMPONENT);
            break;
        default:
            break;
    }

    std::vector<MessageHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers = handlers_;
    }
    for (const auto& handler : handlers) {
        handler(message);
    }
    return Ok();
}

void SignalingCoordinator::setState(SignalingState state) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == state) {
            return;
        }
        state_ = state;
    }

    LOG_DEBUG_COMP_IF("Signaling state: " + toString(state), COMPONENT);

    Json::Value payload;
    payload["state"] = toString(state);
    eventBus_.publish(events::SIGNALING_STATE, payload);
}

} // namespace CubeLink

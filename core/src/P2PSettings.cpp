#include "P2PSettings.h"
#include "Constants.h"
#include "Logger.h"

#include <sstream>

namespace CubeLink {

namespace {

const std::vector<std::string> kDefaultStunServers = {
    "stun:stun.l.google.com:19302",
    "stun:stun1.l.google.com:19302",
    "stun:stun2.l.google.com:19302",
    "stun:stun3.l.google.com:19302",
    "stun:stun.mozilla.org:3478",
};

// Public relays; deployments are expected to override these
const std::vector<TurnServer> kDefaultTurnServers = {
    {"turn:openrelay.metered.ca:80", "openrelayproject", "openrelayproject"},
    {"turn:openrelay.metered.ca:443", "openrelayproject", "openrelayproject"},
};

bool isPositiveInteger(const std::string& value) {
    if (value.empty()) {
        return false;
    }
    for (char c : value) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    return value.find_first_not_of('0') != std::string::npos;
}

bool isNonNegativeInteger(const std::string& value) {
    if (value.empty()) {
        return false;
    }
    for (char c : value) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    return true;
}

// "url|username|credential"
bool parseTurnEntry(const std::string& entry, TurnServer& out) {
    std::vector<std::string> parts;
    std::stringstream ss(entry);
    std::string part;
    while (std::getline(ss, part, '|')) {
        parts.push_back(part);
    }
    if (parts.size() != 3 || parts[0].empty()) {
        return false;
    }
    out = TurnServer{parts[0], parts[1], parts[2]};
    return true;
}

} // namespace

P2PSettings P2PSettings::defaults() {
    P2PSettings settings;
    settings.signalingUrl = constants::DEFAULT_SIGNALING_URL;
    settings.stunServers = kDefaultStunServers;
    settings.turnServers = kDefaultTurnServers;
    settings.roomTtl = std::chrono::seconds(constants::DEFAULT_ROOM_TTL_SEC);
    settings.defaultMaxPeers = constants::DEFAULT_MAX_PEERS;
    settings.codeMaxAttempts = constants::DEFAULT_CODE_MAX_ATTEMPTS;
    settings.idleTimeout = std::chrono::milliseconds(constants::DEFAULT_IDLE_TIMEOUT_MS);
    settings.sendTimeout = std::chrono::milliseconds(constants::DEFAULT_SEND_TIMEOUT_MS);
    settings.workerThreads = constants::DEFAULT_WORKER_THREADS;
    return settings;
}

P2PSettings P2PSettings::fromConfig(const Config& config) {
    P2PSettings settings = defaults();

    settings.signalingUrl = config.get("signaling.url", settings.signalingUrl);

    if (config.hasKey("signaling.stun_servers")) {
        settings.stunServers = config.getList("signaling.stun_servers");
    }

    if (config.hasKey("signaling.turn_servers")) {
        settings.turnServers.clear();
        for (const auto& entry : config.getList("signaling.turn_servers")) {
            TurnServer server;
            if (parseTurnEntry(entry, server)) {
                settings.turnServers.push_back(server);
            } else {
                Logger::instance().warn("Ignoring malformed TURN entry: " + entry, "Config");
            }
        }
    }

    settings.roomTtl = std::chrono::seconds(
        config.getSize("room.ttl_seconds", static_cast<size_t>(settings.roomTtl.count())));
    settings.defaultMaxPeers = config.getSize("room.default_max_peers", settings.defaultMaxPeers);
    settings.codeMaxAttempts = config.getInt("room.code_max_attempts", settings.codeMaxAttempts);
    settings.idleTimeout = std::chrono::milliseconds(
        config.getSize("transfer.idle_timeout_ms", static_cast<size_t>(settings.idleTimeout.count())));
    settings.sendTimeout = std::chrono::milliseconds(
        config.getSize("transfer.send_timeout_ms", static_cast<size_t>(settings.sendTimeout.count())));
    settings.workerThreads = config.getSize("transfer.worker_threads", settings.workerThreads);

    if (settings.codeMaxAttempts <= 0) {
        settings.codeMaxAttempts = constants::DEFAULT_CODE_MAX_ATTEMPTS;
    }
    if (settings.workerThreads == 0) {
        settings.workerThreads = constants::DEFAULT_WORKER_THREADS;
    }

    return settings;
}

std::unordered_map<std::string, Config::Validator> P2PSettings::schema() {
    auto positive = [](const std::string&, const std::string& value) {
        return isPositiveInteger(value);
    };
    auto nonNegative = [](const std::string&, const std::string& value) {
        return isNonNegativeInteger(value);
    };
    return {
        {"room.ttl_seconds", nonNegative},
        {"room.default_max_peers", positive},
        {"room.code_max_attempts", positive},
        {"transfer.idle_timeout_ms", positive},
        {"transfer.send_timeout_ms", positive},
        {"transfer.worker_threads", positive},
    };
}

} // namespace CubeLink

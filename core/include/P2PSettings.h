#pragma once

#include "Config.h"
#include <chrono>
#include <string>
#include <unordered_map>
#include <vector>

namespace CubeLink {

struct TurnServer {
    std::string urls;
    std::string username;
    std::string credential;
};

/**
 * @brief Typed view of the Config keys used by the P2P subsystem
 */
struct P2PSettings {
    std::string signalingUrl;
    std::vector<std::string> stunServers;
    std::vector<TurnServer> turnServers;

    std::chrono::seconds roomTtl{0};
    size_t defaultMaxPeers{0};
    int codeMaxAttempts{0};

    std::chrono::milliseconds idleTimeout{0};
    std::chrono::milliseconds sendTimeout{0};
    size_t workerThreads{0};

    static P2PSettings defaults();
    static P2PSettings fromConfig(const Config& config);

    // Validators for the numeric keys, for Config::validate()
    static std::unordered_map<std::string, Config::Validator> schema();
};

} // namespace CubeLink

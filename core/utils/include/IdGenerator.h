#pragma once

#include <string>

namespace CubeLink {

/**
 * @brief Identifier helpers backed by libuuid
 */
class IdGenerator {
public:
    // Random (v4) UUID, lower-case canonical form
    static std::string uuid();

    // "peer_" followed by the first UUID group, e.g. peer_3f2a9c1d
    static std::string peerId();
};

} // namespace CubeLink

#include "IdGenerator.h"

#include <uuid/uuid.h>

namespace CubeLink {

std::string IdGenerator::uuid() {
    uuid_t raw;
    uuid_generate_random(raw);
    char str[37];
    uuid_unparse_lower(raw, str);
    return std::string(str);
}

std::string IdGenerator::peerId() {
    std::string id = uuid();
    return "peer_" + id.substr(0, id.find('-'));
}

} // namespace CubeLink

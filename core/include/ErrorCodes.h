#pragma once

#include <string>
#include "Result.h"

namespace CubeLink {

enum class ErrorCode : int {
    // Room errors (1000-1999)
    ROOM_NOT_FOUND = 1000,
    ROOM_FULL = 1001,
    ROOM_EXPIRED = 1002,
    ROOM_CODE_EXHAUSTED = 1003,

    // Transfer errors (2000-2999)
    FILE_IO_ERROR = 2000,
    CHECKSUM_MISMATCH = 2001,
    ENCRYPTION_FAILED = 2002,
    DECRYPTION_FAILED = 2003,
    TRANSFER_CANCELLED = 2004,
    TRANSFER_NOT_FOUND = 2005,
    TRANSFER_TIMEOUT = 2006,
    INVALID_TRANSITION = 2007,
    NO_SESSION_KEY = 2008,
    TRANSPORT_UNAVAILABLE = 2009,

    // Signaling errors (3000-3999)
    SIGNALING_CONNECTION_FAILED = 3000,
    SIGNALING_NOT_CONNECTED = 3001,
    SIGNALING_PROTOCOL_ERROR = 3002,
    KEY_EXCHANGE_FAILED = 3003,

    // System errors (5000-5999)
    INTERNAL_ERROR = 5000,
    INVALID_CONFIGURATION = 5001,

    SUCCESS = 0
};

class ErrorRegistry {
public:
    static std::string getMessage(ErrorCode code);
};

/**
 * @brief Build a Result error for the given code.
 *
 * The message is the registry text, followed by ": details" when details
 * are given.
 */
Error makeError(ErrorCode code, const std::string& details = "", const std::string& component = "");

inline bool hasCode(const Error& error, ErrorCode code) {
    return error.code == static_cast<int>(code);
}

} // namespace CubeLink

#include "ErrorCodes.h"

#include <unordered_map>

namespace CubeLink {

namespace {

const std::unordered_map<int, std::string>& messages() {
    static const std::unordered_map<int, std::string> table = {
        {static_cast<int>(ErrorCode::ROOM_NOT_FOUND), "Room not found"},
        {static_cast<int>(ErrorCode::ROOM_FULL), "Room is full"},
        {static_cast<int>(ErrorCode::ROOM_EXPIRED), "Room has expired"},
        {static_cast<int>(ErrorCode::ROOM_CODE_EXHAUSTED), "Could not allocate a unique access code"},

        {static_cast<int>(ErrorCode::FILE_IO_ERROR), "File I/O error"},
        {static_cast<int>(ErrorCode::CHECKSUM_MISMATCH), "Checksum mismatch"},
        {static_cast<int>(ErrorCode::ENCRYPTION_FAILED), "Chunk encryption failed"},
        {static_cast<int>(ErrorCode::DECRYPTION_FAILED), "Chunk decryption failed"},
        {static_cast<int>(ErrorCode::TRANSFER_CANCELLED), "Transfer cancelled"},
        {static_cast<int>(ErrorCode::TRANSFER_NOT_FOUND), "Transfer not found"},
        {static_cast<int>(ErrorCode::TRANSFER_TIMEOUT), "Transfer idle timeout"},
        {static_cast<int>(ErrorCode::INVALID_TRANSITION), "Invalid transfer state transition"},
        {static_cast<int>(ErrorCode::NO_SESSION_KEY), "No session key established for room"},
        {static_cast<int>(ErrorCode::TRANSPORT_UNAVAILABLE), "Data channel unavailable"},

        {static_cast<int>(ErrorCode::SIGNALING_CONNECTION_FAILED), "Signaling connection failed"},
        {static_cast<int>(ErrorCode::SIGNALING_NOT_CONNECTED), "Signaling is not connected"},
        {static_cast<int>(ErrorCode::SIGNALING_PROTOCOL_ERROR), "Malformed signaling message"},
        {static_cast<int>(ErrorCode::KEY_EXCHANGE_FAILED), "Key exchange failed"},

        {static_cast<int>(ErrorCode::INTERNAL_ERROR), "Internal error"},
        {static_cast<int>(ErrorCode::INVALID_CONFIGURATION), "Invalid configuration"},

        {static_cast<int>(ErrorCode::SUCCESS), "Operation successful"}
    };
    return table;
}

} // namespace

std::string ErrorRegistry::getMessage(ErrorCode code) {
    const auto& table = messages();
    auto it = table.find(static_cast<int>(code));
    if (it != table.end()) {
        return it->second;
    }
    return "Unknown error";
}

Error makeError(ErrorCode code, const std::string& details, const std::string& component) {
    std::string message = ErrorRegistry::getMessage(code);
    if (!details.empty()) {
        message += ": " + details;
    }
    return Error(std::move(message), static_cast<int>(code), component);
}

} // namespace CubeLink

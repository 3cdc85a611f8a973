#pragma once

#include "Result.h"
#include <cstdint>
#include <string>
#include <vector>

namespace CubeLink {

/**
 * @brief X25519 key agreement for distributing room chunk keys
 *
 * Each process holds one ephemeral X25519 key pair. Its public half is sent
 * to room peers over signaling (key_exchange). Combining it with a peer's
 * public key yields a pairwise wrapping key:
 *
 *   wrap_key = HKDF-SHA256(ikm = X25519(local, peer), salt = room_id,
 *                          info = "CubeLink-Key-Wrap-v1", L = 32)
 *
 * The room host seals the room's random chunk key under the wrap key it
 * shares with each joiner, so every member of a room holds the same chunk
 * key and neither key crosses the wire in the clear.
 */
class KeyAgreement {
public:
    static constexpr size_t KEY_SIZE = 32;

    /**
     * @throws std::runtime_error if key generation fails
     */
    KeyAgreement();
    ~KeyAgreement();

    KeyAgreement(const KeyAgreement&) = delete;
    KeyAgreement& operator=(const KeyAgreement&) = delete;

    const std::vector<uint8_t>& publicKey() const { return publicKey_; }
    std::string publicKeyHex() const;

    /**
     * @brief Derive the wrapping key shared with a peer for one room
     * @return 32-byte key, or KEY_EXCHANGE_FAILED for malformed or
     *         low-order peer keys
     */
    Result<std::vector<uint8_t>> deriveWrapKey(const std::vector<uint8_t>& peerPublicKey,
                                               const std::string& roomId) const;

    // Accepts the hex form carried in key_exchange messages
    Result<std::vector<uint8_t>> deriveWrapKey(const std::string& peerPublicKeyHex,
                                               const std::string& roomId) const;

    /**
     * @brief Seal a room key for one recipient
     *
     * The frame is bound to the room and the recipient's peer id, so it
     * cannot be replayed to another peer or room.
     * @return Hex frame for the wrapped_key field, or KEY_EXCHANGE_FAILED
     */
    Result<std::string> wrapRoomKey(const std::vector<uint8_t>& roomKey,
                                    const std::string& recipientPublicKeyHex,
                                    const std::string& roomId,
                                    const std::string& recipientId) const;

    /**
     * @brief Open a room key sealed for this side by wrapRoomKey()
     * @return The 32-byte room key, or KEY_EXCHANGE_FAILED
     */
    Result<std::vector<uint8_t>> unwrapRoomKey(const std::string& wrappedKeyHex,
                                               const std::string& senderPublicKeyHex,
                                               const std::string& roomId,
                                               const std::string& localId) const;

private:
    static std::vector<uint8_t> performECDH(const std::vector<uint8_t>& privateKey,
                                            const std::vector<uint8_t>& peerPublicKey);
    static std::vector<uint8_t> wrapAad(const std::string& roomId, const std::string& recipientId);
    static std::vector<uint8_t> hkdf(const std::vector<uint8_t>& ikm,
                                     const std::vector<uint8_t>& salt,
                                     const std::string& info,
                                     size_t length);

    std::vector<uint8_t> privateKey_;
    std::vector<uint8_t> publicKey_;
};

} // namespace CubeLink

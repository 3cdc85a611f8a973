#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>

namespace CubeLink {

/**
 * @brief OpenSSL-backed primitives shared by the security components
 *
 * - AES-256-GCM with a 96-bit nonce and a 128-bit tag
 * - CSPRNG bytes
 * - constant-time comparison and hex helpers
 */
class Crypto {
public:
    static constexpr size_t KEY_SIZE = 32;      // 256 bits
    static constexpr size_t GCM_IV_SIZE = 12;   // 96 bits
    static constexpr size_t GCM_TAG_SIZE = 16;  // 128 bits

    /**
     * @brief Fill a buffer from the OpenSSL CSPRNG
     * @throws std::runtime_error if the generator fails
     */
    static std::vector<uint8_t> randomBytes(size_t count);

    /**
     * @brief Generate a random 32-byte AES-256 key
     */
    static std::vector<uint8_t> generateKey();

    /**
     * @brief Generate a random 12-byte GCM nonce
     */
    static std::vector<uint8_t> generateGcmNonce();

    /**
     * @brief Encrypt using AES-256-GCM
     *
     * @param plaintext Data to encrypt (may be empty)
     * @param key 32-byte key
     * @param nonce 12-byte nonce, unique per key
     * @param aad Additional authenticated data, not encrypted
     * @return Ciphertext with the 16-byte tag appended
     * @throws std::runtime_error on invalid sizes or OpenSSL failure
     */
    static std::vector<uint8_t> encryptGcm(
        const std::vector<uint8_t>& plaintext,
        const std::vector<uint8_t>& key,
        const std::vector<uint8_t>& nonce,
        const std::vector<uint8_t>& aad = {}
    );

    /**
     * @brief Decrypt and authenticate AES-256-GCM output
     *
     * @param ciphertext Ciphertext with the tag appended
     * @return Plaintext, or std::nullopt if the tag does not verify or the
     *         input is shorter than a tag
     * @throws std::runtime_error on invalid key/nonce sizes or OpenSSL failure
     */
    static std::optional<std::vector<uint8_t>> decryptGcm(
        const std::vector<uint8_t>& ciphertext,
        const std::vector<uint8_t>& key,
        const std::vector<uint8_t>& nonce,
        const std::vector<uint8_t>& aad = {}
    );

    static bool constantTimeCompare(
        const std::vector<uint8_t>& a,
        const std::vector<uint8_t>& b
    );

    // Overwrite with zeros in a way the optimizer keeps
    static void secureClear(std::vector<uint8_t>& data);

    static std::string toHex(const std::vector<uint8_t>& data);

    /**
     * @brief Convert a hex string to bytes
     * @throws std::invalid_argument on odd length or non-hex characters
     */
    static std::vector<uint8_t> fromHex(const std::string& hex);
};

} // namespace CubeLink

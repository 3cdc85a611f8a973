#pragma once

#include "Result.h"
#include <cstdint>
#include <string>
#include <vector>

namespace CubeLink {

/**
 * @brief Authenticated encryption of individual file chunks
 *
 * A sealed chunk (frame) is laid out as
 *
 *   nonce (12 bytes) || ciphertext || tag (16 bytes)
 *
 * with a fresh random nonce for every call. Frames may be bound to their
 * position in a transfer through associated data (see chunkAad()); a frame
 * opened with different associated data fails authentication.
 */
class ChunkCipher {
public:
    /**
     * @param key 32-byte symmetric key
     * @throws std::invalid_argument if the key has the wrong length
     */
    explicit ChunkCipher(std::vector<uint8_t> key);
    ~ChunkCipher();

    ChunkCipher(const ChunkCipher&) = delete;
    ChunkCipher& operator=(const ChunkCipher&) = delete;

    /**
     * @brief Seal one chunk
     * @return Frame of framedSize(plaintext.size()) bytes, or ENCRYPTION_FAILED
     */
    Result<std::vector<uint8_t>> encryptChunk(const std::vector<uint8_t>& plaintext,
                                              const std::vector<uint8_t>& aad = {}) const;

    /**
     * @brief Open one frame
     * @return Plaintext, or DECRYPTION_FAILED for short, altered or
     *         mis-keyed frames
     */
    Result<std::vector<uint8_t>> decryptChunk(const std::vector<uint8_t>& frame,
                                              const std::vector<uint8_t>& aad = {}) const;

    // transfer_id bytes followed by the chunk index as 8 big-endian bytes
    static std::vector<uint8_t> chunkAad(const std::string& transferId, uint64_t index);

    static size_t framedSize(size_t plaintextSize);

private:
    std::vector<uint8_t> key_;
};

} // namespace CubeLink

#include "ChunkCipher.h"
#include "Crypto.h"
#include "Constants.h"
#include "ErrorCodes.h"
#include "MetricsCollector.h"
#include "LoggerMacros.h"
#include <stdexcept>

namespace CubeLink {

namespace {
const char* COMPONENT = "ChunkCipher";
}

ChunkCipher::ChunkCipher(std::vector<uint8_t> key) : key_(std::move(key)) {
    if (key_.size() != constants::CHUNK_KEY_SIZE) {
        Crypto::secureClear(key_);
        throw std::invalid_argument("Chunk key must be " +
            std::to_string(constants::CHUNK_KEY_SIZE) + " bytes");
    }
}

ChunkCipher::~ChunkCipher() {
    Crypto::secureClear(key_);
}

Result<std::vector<uint8_t>> ChunkCipher::encryptChunk(const std::vector<uint8_t>& plaintext,
                                                       const std::vector<uint8_t>& aad) const {
    try {
        std::vector<uint8_t> nonce = Crypto::generateGcmNonce();
        std::vector<uint8_t> sealed = Crypto::encryptGcm(plaintext, key_, nonce, aad);

        std::vector<uint8_t> frame;
        frame.reserve(nonce.size() + sealed.size());
        frame.insert(frame.end(), nonce.begin(), nonce.end());
        frame.insert(frame.end(), sealed.begin(), sealed.end());
        return frame;
    } catch (const std::exception& e) {
        LOG_ERROR_COMP(std::string("Chunk encryption failed: ") + e.what(), COMPONENT);
        MetricsCollector::instance().incrementEncryptionErrors();
        return makeError(ErrorCode::ENCRYPTION_FAILED, e.what(), COMPONENT);
    }
}

Result<std::vector<uint8_t>> ChunkCipher::decryptChunk(const std::vector<uint8_t>& frame,
                                                       const std::vector<uint8_t>& aad) const {
    if (frame.size() < constants::CHUNK_NONCE_SIZE + constants::CHUNK_TAG_SIZE) {
        MetricsCollector::instance().incrementDecryptionErrors();
        return makeError(ErrorCode::DECRYPTION_FAILED,
                         "frame of " + std::to_string(frame.size()) + " bytes is too short",
                         COMPONENT);
    }

    std::vector<uint8_t> nonce(frame.begin(), frame.begin() + constants::CHUNK_NONCE_SIZE);
    std::vector<uint8_t> sealed(frame.begin() + constants::CHUNK_NONCE_SIZE, frame.end());

    try {
        auto plaintext = Crypto::decryptGcm(sealed, key_, nonce, aad);
        if (!plaintext) {
            return makeError(ErrorCode::DECRYPTION_FAILED, "authentication failed", COMPONENT);
        }
        return std::move(*plaintext);
    } catch (const std::exception& e) {
        LOG_ERROR_COMP(std::string("Chunk decryption failed: ") + e.what(), COMPONENT);
        MetricsCollector::instance().incrementDecryptionErrors();
        return makeError(ErrorCode::DECRYPTION_FAILED, e.what(), COMPONENT);
    }
}

std::vector<uint8_t> ChunkCipher::chunkAad(const std::string& transferId, uint64_t index) {
    std::vector<uint8_t> aad(transferId.begin(), transferId.end());
    for (int shift = 56; shift >= 0; shift -= 8) {
        aad.push_back(static_cast<uint8_t>((index >> shift) & 0xFF));
    }
    return aad;
}

size_t ChunkCipher::framedSize(size_t plaintextSize) {
    return constants::CHUNK_NONCE_SIZE + plaintextSize + constants::CHUNK_TAG_SIZE;
}

} // namespace CubeLink

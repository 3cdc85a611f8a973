#include "KeyAgreement.h"
#include "ChunkCipher.h"
#include "Crypto.h"
#include "Constants.h"
#include "ErrorCodes.h"
#include "MetricsCollector.h"
#include "LoggerMacros.h"
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <stdexcept>

namespace CubeLink {

namespace {
const char* COMPONENT = "KeyAgreement";
}

KeyAgreement::KeyAgreement() {
    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_X25519, nullptr);
    if (!ctx) {
        throw std::runtime_error("Failed to create X25519 context");
    }

    EVP_PKEY* pkey = nullptr;
    if (EVP_PKEY_keygen_init(ctx) <= 0 || EVP_PKEY_keygen(ctx, &pkey) <= 0) {
        EVP_PKEY_CTX_free(ctx);
        throw std::runtime_error("Failed to generate X25519 key pair");
    }
    EVP_PKEY_CTX_free(ctx);

    privateKey_.resize(KEY_SIZE);
    publicKey_.resize(KEY_SIZE);
    size_t privLen = KEY_SIZE;
    size_t pubLen = KEY_SIZE;

    bool ok = EVP_PKEY_get_raw_private_key(pkey, privateKey_.data(), &privLen) == 1 &&
              EVP_PKEY_get_raw_public_key(pkey, publicKey_.data(), &pubLen) == 1;
    EVP_PKEY_free(pkey);

    if (!ok || privLen != KEY_SIZE || pubLen != KEY_SIZE) {
        Crypto::secureClear(privateKey_);
        throw std::runtime_error("Failed to extract X25519 key material");
    }

    LOG_DEBUG_COMP_IF("Generated X25519 key pair", COMPONENT);
}

KeyAgreement::~KeyAgreement() {
    Crypto::secureClear(privateKey_);
}

std::string KeyAgreement::publicKeyHex() const {
    return Crypto::toHex(publicKey_);
}

Result<std::vector<uint8_t>> KeyAgreement::deriveWrapKey(const std::vector<uint8_t>& peerPublicKey,
                                                         const std::string& roomId) const {
    if (peerPublicKey.size() != KEY_SIZE) {
        return makeError(ErrorCode::KEY_EXCHANGE_FAILED,
                         "peer public key must be " + std::to_string(KEY_SIZE) + " bytes",
                         COMPONENT);
    }

    std::vector<uint8_t> shared = performECDH(privateKey_, peerPublicKey);
    if (shared.empty()) {
        LOG_WARN_COMP("X25519 derivation rejected peer key for room " + roomId, COMPONENT);
        return makeError(ErrorCode::KEY_EXCHANGE_FAILED, "X25519 derivation failed", COMPONENT);
    }

    std::vector<uint8_t> salt(roomId.begin(), roomId.end());
    std::vector<uint8_t> key = hkdf(shared, salt, constants::KEY_WRAP_INFO, constants::CHUNK_KEY_SIZE);
    Crypto::secureClear(shared);

    if (key.empty()) {
        return makeError(ErrorCode::KEY_EXCHANGE_FAILED, "HKDF failed", COMPONENT);
    }

    MetricsCollector::instance().incrementKeyExchanges();
    LOG_DEBUG_COMP_IF("Derived wrap key for room " + roomId, COMPONENT);
    return key;
}

Result<std::vector<uint8_t>> KeyAgreement::deriveWrapKey(const std::string& peerPublicKeyHex,
                                                         const std::string& roomId) const {
    std::vector<uint8_t> peerKey;
    try {
        peerKey = Crypto::fromHex(peerPublicKeyHex);
    } catch (const std::invalid_argument& e) {
        return makeError(ErrorCode::KEY_EXCHANGE_FAILED, e.what(), COMPONENT);
    }
    return deriveWrapKey(peerKey, roomId);
}

Result<std::string> KeyAgreement::wrapRoomKey(const std::vector<uint8_t>& roomKey,
                                              const std::string& recipientPublicKeyHex,
                                              const std::string& roomId,
                                              const std::string& recipientId) const {
    if (roomKey.size() != constants::CHUNK_KEY_SIZE) {
        return makeError(ErrorCode::KEY_EXCHANGE_FAILED, "room key must be " +
                         std::to_string(constants::CHUNK_KEY_SIZE) + " bytes", COMPONENT);
    }

    auto wrapKey = deriveWrapKey(recipientPublicKeyHex, roomId);
    if (!wrapKey) {
        return wrapKey.error();
    }

    ChunkCipher sealer(wrapKey.value());
    Crypto::secureClear(wrapKey.value());

    auto frame = sealer.encryptChunk(roomKey, wrapAad(roomId, recipientId));
    if (!frame) {
        return makeError(ErrorCode::KEY_EXCHANGE_FAILED, frame.error().message, COMPONENT);
    }
    return Crypto::toHex(frame.value());
}

Result<std::vector<uint8_t>> KeyAgreement::unwrapRoomKey(const std::string& wrappedKeyHex,
                                                         const std::string& senderPublicKeyHex,
                                                         const std::string& roomId,
                                                         const std::string& localId) const {
    std::vector<uint8_t> frame;
    try {
        frame = Crypto::fromHex(wrappedKeyHex);
    } catch (const std::invalid_argument& e) {
        return makeError(ErrorCode::KEY_EXCHANGE_FAILED, e.what(), COMPONENT);
    }

    auto wrapKey = deriveWrapKey(senderPublicKeyHex, roomId);
    if (!wrapKey) {
        return wrapKey.error();
    }

    ChunkCipher opener(wrapKey.value());
    Crypto::secureClear(wrapKey.value());

    auto roomKey = opener.decryptChunk(frame, wrapAad(roomId, localId));
    if (!roomKey) {
        return makeError(ErrorCode::KEY_EXCHANGE_FAILED, "room key does not open for " + localId, COMPONENT);
    }
    if (roomKey.value().size() != constants::CHUNK_KEY_SIZE) {
        Crypto::secureClear(roomKey.value());
        return makeError(ErrorCode::KEY_EXCHANGE_FAILED, "unwrapped room key has the wrong size", COMPONENT);
    }
    return roomKey;
}

// room_id, a zero byte, then the recipient's peer id
std::vector<uint8_t> KeyAgreement::wrapAad(const std::string& roomId, const std::string& recipientId) {
    std::vector<uint8_t> aad(roomId.begin(), roomId.end());
    aad.push_back(0);
    aad.insert(aad.end(), recipientId.begin(), recipientId.end());
    return aad;
}

std::vector<uint8_t> KeyAgreement::performECDH(const std::vector<uint8_t>& privateKey,
                                               const std::vector<uint8_t>& peerPublicKey) {
    EVP_PKEY* privKey = EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519, nullptr,
                                                     privateKey.data(), privateKey.size());
    if (!privKey) {
        return {};
    }

    EVP_PKEY* peerKey = EVP_PKEY_new_raw_public_key(EVP_PKEY_X25519, nullptr,
                                                    peerPublicKey.data(), peerPublicKey.size());
    if (!peerKey) {
        EVP_PKEY_free(privKey);
        return {};
    }

    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new(privKey, nullptr);
    if (!ctx) {
        EVP_PKEY_free(privKey);
        EVP_PKEY_free(peerKey);
        return {};
    }

    std::vector<uint8_t> sharedSecret;
    size_t secretLen = 0;

    // OpenSSL refuses an all-zero result, which covers low-order peer points
    if (EVP_PKEY_derive_init(ctx) > 0 &&
        EVP_PKEY_derive_set_peer(ctx, peerKey) > 0 &&
        EVP_PKEY_derive(ctx, nullptr, &secretLen) > 0) {

        sharedSecret.resize(secretLen);
        if (EVP_PKEY_derive(ctx, sharedSecret.data(), &secretLen) <= 0) {
            Crypto::secureClear(sharedSecret);
            sharedSecret.clear();
        } else {
            sharedSecret.resize(secretLen);
        }
    }

    EVP_PKEY_CTX_free(ctx);
    EVP_PKEY_free(privKey);
    EVP_PKEY_free(peerKey);

    return sharedSecret;
}

std::vector<uint8_t> KeyAgreement::hkdf(const std::vector<uint8_t>& ikm,
                                        const std::vector<uint8_t>& salt,
                                        const std::string& info,
                                        size_t length) {
    std::vector<uint8_t> output(length);

    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr);
    if (!ctx) {
        return {};
    }

    bool ok = EVP_PKEY_derive_init(ctx) > 0 &&
              EVP_PKEY_CTX_set_hkdf_md(ctx, EVP_sha256()) > 0 &&
              EVP_PKEY_CTX_set1_hkdf_key(ctx, ikm.data(), static_cast<int>(ikm.size())) > 0;

    if (ok && !salt.empty()) {
        ok = EVP_PKEY_CTX_set1_hkdf_salt(ctx, salt.data(), static_cast<int>(salt.size())) > 0;
    }
    if (ok && !info.empty()) {
        ok = EVP_PKEY_CTX_add1_hkdf_info(ctx,
                reinterpret_cast<const unsigned char*>(info.data()),
                static_cast<int>(info.size())) > 0;
    }

    size_t outLen = length;
    if (ok) {
        ok = EVP_PKEY_derive(ctx, output.data(), &outLen) > 0 && outLen == length;
    }

    EVP_PKEY_CTX_free(ctx);

    if (!ok) {
        Crypto::secureClear(output);
        return {};
    }
    return output;
}

} // namespace CubeLink

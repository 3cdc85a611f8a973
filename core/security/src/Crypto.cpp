#include "Crypto.h"
#include "Logger.h"
#include "MetricsCollector.h"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/crypto.h>
#include <stdexcept>

namespace CubeLink {

std::vector<uint8_t> Crypto::randomBytes(size_t count) {
    std::vector<uint8_t> bytes(count);
    if (count == 0) {
        return bytes;
    }
    if (RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
        Logger::instance().log(LogLevel::ERROR, "CSPRNG failure", "Crypto");
        throw std::runtime_error("Failed to generate random bytes");
    }
    return bytes;
}

std::vector<uint8_t> Crypto::generateKey() {
    return randomBytes(KEY_SIZE);
}

std::vector<uint8_t> Crypto::generateGcmNonce() {
    return randomBytes(GCM_IV_SIZE);
}

std::vector<uint8_t> Crypto::encryptGcm(
    const std::vector<uint8_t>& plaintext,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& nonce,
    const std::vector<uint8_t>& aad
) {
    auto& logger = Logger::instance();
    auto& metrics = MetricsCollector::instance();

    if (key.size() != KEY_SIZE) {
        logger.log(LogLevel::ERROR, "Invalid key size for GCM encryption", "Crypto");
        metrics.incrementEncryptionErrors();
        throw std::runtime_error("Invalid key size");
    }
    if (nonce.size() != GCM_IV_SIZE) {
        logger.log(LogLevel::ERROR, "Invalid nonce size for GCM", "Crypto");
        metrics.incrementEncryptionErrors();
        throw std::runtime_error("Invalid nonce size (must be 12 bytes)");
    }

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        throw std::runtime_error("Failed to create cipher context");
    }

    if (EVP_EncryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        throw std::runtime_error("Failed to initialize GCM");
    }

    if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(GCM_IV_SIZE), nullptr) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        throw std::runtime_error("Failed to set GCM IV length");
    }

    if (EVP_EncryptInit_ex(ctx, nullptr, nullptr, key.data(), nonce.data()) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        throw std::runtime_error("Failed to set GCM key/nonce");
    }

    int len = 0;

    if (!aad.empty()) {
        if (EVP_EncryptUpdate(ctx, nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1) {
            EVP_CIPHER_CTX_free(ctx);
            throw std::runtime_error("Failed to add AAD");
        }
    }

    std::vector<uint8_t> ciphertext(plaintext.size() + GCM_TAG_SIZE);
    int ciphertext_len = 0;

    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx, ciphertext.data(), &len, plaintext.data(),
                              static_cast<int>(plaintext.size())) != 1) {
            EVP_CIPHER_CTX_free(ctx);
            throw std::runtime_error("GCM encryption failed");
        }
        ciphertext_len = len;
    }

    if (EVP_EncryptFinal_ex(ctx, ciphertext.data() + ciphertext_len, &len) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        throw std::runtime_error("GCM finalization failed");
    }
    ciphertext_len += len;

    // Tag goes right after the ciphertext
    if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_GET_TAG, static_cast<int>(GCM_TAG_SIZE),
                            ciphertext.data() + ciphertext_len) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        throw std::runtime_error("Failed to get GCM tag");
    }
    ciphertext_len += static_cast<int>(GCM_TAG_SIZE);

    EVP_CIPHER_CTX_free(ctx);

    ciphertext.resize(static_cast<size_t>(ciphertext_len));
    return ciphertext;
}

std::optional<std::vector<uint8_t>> Crypto::decryptGcm(
    const std::vector<uint8_t>& ciphertext,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& nonce,
    const std::vector<uint8_t>& aad
) {
    auto& logger = Logger::instance();
    auto& metrics = MetricsCollector::instance();

    if (key.size() != KEY_SIZE) {
        logger.log(LogLevel::ERROR, "Invalid key size for GCM decryption", "Crypto");
        throw std::runtime_error("Invalid key size");
    }
    if (nonce.size() != GCM_IV_SIZE) {
        logger.log(LogLevel::ERROR, "Invalid nonce size for GCM", "Crypto");
        throw std::runtime_error("Invalid nonce size");
    }
    if (ciphertext.size() < GCM_TAG_SIZE) {
        logger.log(LogLevel::WARN, "Ciphertext too short for GCM", "Crypto");
        metrics.incrementDecryptionErrors();
        return std::nullopt;
    }

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        throw std::runtime_error("Failed to create cipher context");
    }

    if (EVP_DecryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        throw std::runtime_error("Failed to initialize GCM decryption");
    }

    if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(GCM_IV_SIZE), nullptr) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        throw std::runtime_error("Failed to set GCM IV length");
    }

    if (EVP_DecryptInit_ex(ctx, nullptr, nullptr, key.data(), nonce.data()) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        throw std::runtime_error("Failed to set GCM key/nonce");
    }

    int len = 0;

    if (!aad.empty()) {
        if (EVP_DecryptUpdate(ctx, nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1) {
            EVP_CIPHER_CTX_free(ctx);
            throw std::runtime_error("Failed to add AAD");
        }
    }

    size_t actualCiphertextLen = ciphertext.size() - GCM_TAG_SIZE;

    // One spare byte keeps data() non-null for an empty payload
    std::vector<uint8_t> plaintext(actualCiphertextLen + 1);
    int plaintext_len = 0;
    if (actualCiphertextLen > 0) {
        if (EVP_DecryptUpdate(ctx, plaintext.data(), &len, ciphertext.data(),
                              static_cast<int>(actualCiphertextLen)) != 1) {
            EVP_CIPHER_CTX_free(ctx);
            metrics.incrementDecryptionErrors();
            return std::nullopt;
        }
        plaintext_len = len;
    }

    if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_TAG, static_cast<int>(GCM_TAG_SIZE),
                            const_cast<uint8_t*>(ciphertext.data() + actualCiphertextLen)) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        metrics.incrementDecryptionErrors();
        return std::nullopt;
    }

    // Tag verification happens here
    int ret = EVP_DecryptFinal_ex(ctx, plaintext.data() + plaintext_len, &len);
    EVP_CIPHER_CTX_free(ctx);

    if (ret <= 0) {
        logger.log(LogLevel::WARN, "GCM authentication failed", "Crypto");
        metrics.incrementDecryptionErrors();
        secureClear(plaintext);
        return std::nullopt;
    }

    plaintext_len += len;
    plaintext.resize(static_cast<size_t>(plaintext_len));
    return plaintext;
}

bool Crypto::constantTimeCompare(
    const std::vector<uint8_t>& a,
    const std::vector<uint8_t>& b
) {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

void Crypto::secureClear(std::vector<uint8_t>& data) {
    if (!data.empty()) {
        OPENSSL_cleanse(data.data(), data.size());
    }
}

std::string Crypto::toHex(const std::vector<uint8_t>& data) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (uint8_t byte : data) {
        out.push_back(digits[byte >> 4]);
        out.push_back(digits[byte & 0x0F]);
    }
    return out;
}

std::vector<uint8_t> Crypto::fromHex(const std::string& hex) {
    if (hex.length() % 2 != 0) {
        throw std::invalid_argument("Invalid hex string length");
    }

    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::vector<uint8_t> data;
    data.reserve(hex.length() / 2);

    for (size_t i = 0; i < hex.length(); i += 2) {
        int hi = nibble(hex[i]);
        int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("Invalid hex character");
        }
        data.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }

    return data;
}

} // namespace CubeLink

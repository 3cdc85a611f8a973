#include "IntegrityVerifier.h"
#include "Constants.h"
#include "Crypto.h"
#include "ErrorCodes.h"
#include "MetricsCollector.h"
#include "LoggerMacros.h"
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace CubeLink {

namespace {

const char* COMPONENT = "IntegrityVerifier";

std::string digestToHex(const unsigned char* digest, unsigned int length) {
    std::stringstream ss;
    for (unsigned int i = 0; i < length; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return ss.str();
}

} // namespace

Result<std::string> IntegrityVerifier::hashFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        LOG_ERROR_COMP("Cannot open file for hashing: " + path, COMPONENT);
        return makeError(ErrorCode::FILE_IO_ERROR, "cannot open " + path, COMPONENT);
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        return makeError(ErrorCode::INTERNAL_ERROR, "failed to create digest context", COMPONENT);
    }

    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        return makeError(ErrorCode::INTERNAL_ERROR, "failed to initialize SHA-256", COMPONENT);
    }

    char buffer[constants::HASH_BUFFER_SIZE];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (EVP_DigestUpdate(ctx, buffer, static_cast<size_t>(file.gcount())) != 1) {
            EVP_MD_CTX_free(ctx);
            return makeError(ErrorCode::INTERNAL_ERROR, "SHA-256 update failed", COMPONENT);
        }
    }

    if (file.bad()) {
        EVP_MD_CTX_free(ctx);
        LOG_ERROR_COMP("Read error while hashing: " + path, COMPONENT);
        return makeError(ErrorCode::FILE_IO_ERROR, "read error on " + path, COMPONENT);
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    if (EVP_DigestFinal_ex(ctx, digest, &digestLen) != 1) {
        EVP_MD_CTX_free(ctx);
        return makeError(ErrorCode::INTERNAL_ERROR, "SHA-256 finalization failed", COMPONENT);
    }
    EVP_MD_CTX_free(ctx);

    return digestToHex(digest, digestLen);
}

std::string IntegrityVerifier::hashBytes(const std::vector<uint8_t>& data) {
    return hashBytes(data.data(), data.size());
}

std::string IntegrityVerifier::hashBytes(const uint8_t* data, size_t length) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    static const uint8_t empty = 0;

    if (EVP_Digest(length > 0 ? data : &empty, length, digest, &digestLen, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 computation failed");
    }
    return digestToHex(digest, digestLen);
}

VoidResult IntegrityVerifier::verifyFile(const std::string& path, const std::string& expectedHex) {
    auto actual = hashFile(path);
    if (!actual) {
        return actual.error();
    }

    std::string expected = expectedHex;
    std::transform(expected.begin(), expected.end(), expected.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const std::vector<uint8_t> actualBytes(actual.value().begin(), actual.value().end());
    const std::vector<uint8_t> expectedBytes(expected.begin(), expected.end());
    if (!Crypto::constantTimeCompare(actualBytes, expectedBytes)) {
        MetricsCollector::instance().incrementChecksumMismatches();
        LOG_WARN_COMP("Checksum mismatch for " + path + ": expected " + expected +
                      ", got " + actual.value(), COMPONENT);
        return makeError(ErrorCode::CHECKSUM_MISMATCH, "", COMPONENT);
    }
    return Ok();
}

} // namespace CubeLink

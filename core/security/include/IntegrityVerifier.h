#pragma once

#include "Result.h"
#include <cstdint>
#include <string>
#include <vector>

namespace CubeLink {

/**
 * @brief Whole-file SHA-256 used to verify transfers end to end
 *
 * Digests are 64 lower-case hex characters. Files are streamed through
 * an 8 KiB buffer, so memory use does not depend on file size.
 */
class IntegrityVerifier {
public:
    /**
     * @brief Hash a file on disk
     * @return Hex digest, or FILE_IO_ERROR if the file cannot be read
     */
    static Result<std::string> hashFile(const std::string& path);

    static std::string hashBytes(const std::vector<uint8_t>& data);
    static std::string hashBytes(const uint8_t* data, size_t length);

    /**
     * @brief Re-hash a file and compare against an expected digest
     * @return CHECKSUM_MISMATCH when the digests differ
     */
    static VoidResult verifyFile(const std::string& path, const std::string& expectedHex);
};

} // namespace CubeLink

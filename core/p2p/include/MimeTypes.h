#pragma once

#include <string>

namespace CubeLink {

/**
 * @brief MIME type for a path, from its extension (case-insensitive)
 *
 * Unknown or missing extensions map to application/octet-stream.
 */
std::string detectMimeType(const std::string& path);

} // namespace CubeLink

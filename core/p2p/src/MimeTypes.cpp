#include "MimeTypes.h"
#include "Constants.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <unordered_map>

namespace CubeLink {

std::string detectMimeType(const std::string& path) {
    static const std::unordered_map<std::string, std::string> types = {
        {"pdf", "application/pdf"},
        {"doc", "application/msword"},
        {"docx", "application/msword"},
        {"xls", "application/vnd.ms-excel"},
        {"xlsx", "application/vnd.ms-excel"},
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"png", "image/png"},
        {"gif", "image/gif"},
        {"mp4", "video/mp4"},
        {"mp3", "audio/mpeg"},
        {"zip", "application/zip"},
        {"txt", "text/plain"}
    };

    std::string ext = std::filesystem::path(path).extension().string();
    if (!ext.empty() && ext[0] == '.') {
        ext.erase(0, 1);
    }
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = types.find(ext);
    return it != types.end() ? it->second : constants::DEFAULT_MIME_TYPE;
}

} // namespace CubeLink

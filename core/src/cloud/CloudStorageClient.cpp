#include "openxfer/CloudStorageClient.hpp"
#include <algorithm>
#include <cctype>
#include <map>

namespace openxfer {

std::string guessMimeType(const std::string& fileName) {
    static const std::map<std::string, std::string> kTypes = {
        {"jpg", "image/jpeg"}, {"jpeg", "image/jpeg"}, {"png", "image/png"},
        {"gif", "image/gif"}, {"webp", "image/webp"}, {"heic", "image/heic"},
        {"mp4", "video/mp4"}, {"webm", "video/webm"}, {"mkv", "video/x-matroska"},
        {"mov", "video/quicktime"}, {"mp3", "audio/mpeg"}, {"wav", "audio/wav"},
        {"flac", "audio/flac"}, {"txt", "text/plain"}, {"json", "application/json"},
        {"pdf", "application/pdf"}, {"zip", "application/zip"},
    };
    const auto dot = fileName.find_last_of('.');
    if (dot == std::string::npos || dot + 1 == fileName.size()) return "application/octet-stream";
    std::string ext = fileName.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    auto it = kTypes.find(ext);
    return it == kTypes.end() ? "application/octet-stream" : it->second;
}

} // namespace openxfer

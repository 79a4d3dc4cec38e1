#include "infrastructure/MediaUtils.hpp"

#include "domain/MediaTypes.hpp"

#include <filesystem>
#include <map>

namespace scribeline::infrastructure {

std::string MediaUtils::GuessMimeType(const std::string& path) {
    static const std::map<std::string, std::string> kByExtension = {
        {".m4a", "audio/m4a"},
        {".mp3", "audio/mpeg"},
        {".wav", "audio/wav"},
        {".webm", "audio/webm"},
        {".ogg", "audio/ogg"},
        {".oga", "audio/ogg"},
        {".flac", "audio/flac"},
        {".aac", "audio/aac"},
        {".mp4", "video/mp4"},
        {".txt", "text/plain"},
        {".pdf", "application/pdf"}
    };
    const std::string ext = domain::ToLowerAscii(std::filesystem::path(path).extension().string());
    auto it = kByExtension.find(ext);
    if (it != kByExtension.end()) {
        return it->second;
    }
    return "application/octet-stream";
}

} // namespace scribeline::infrastructure

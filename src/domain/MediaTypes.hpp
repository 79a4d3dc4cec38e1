/**
 * @file MediaTypes.hpp
 * @brief Media types accepted by the transcription provider.
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace scribeline::domain {

inline std::string ToLowerAscii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

/**
 * @brief True when either the MIME type or the file extension is one the provider accepts.
 */
inline bool IsSupportedMediaType(const std::string& mimeType, const std::string& fileName) {
    static const char* const kKnownTypes[] = {
        "audio/m4a", "audio/mp4", "audio/x-m4a", "audio/mpeg", "audio/wav",
        "audio/x-wav", "audio/webm", "audio/ogg", "audio/flac", "video/mp4"
    };
    const std::string mime = ToLowerAscii(mimeType);
    for (const char* known : kKnownTypes) {
        if (mime == known) return true;
    }
    if (mime.rfind("audio/", 0) == 0) return true;

    const std::string name = ToLowerAscii(fileName);
    for (const char* ext : {".m4a", ".mp3", ".wav"}) {
        const std::string suffix(ext);
        if (name.size() >= suffix.size() &&
            name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace scribeline::domain

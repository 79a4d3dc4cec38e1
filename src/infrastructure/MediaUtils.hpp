#pragma once

#include <string>

namespace scribeline::infrastructure {

/**
 * @brief Utilities for media files.
 */
class MediaUtils {
public:
    /**
     * @brief Guesses the MIME type from the file extension.
     * @return "application/octet-stream" for unknown extensions.
     */
    static std::string GuessMimeType(const std::string& path);
};

} // namespace scribeline::infrastructure

/**
 * @file HttpSupport.hpp
 * @brief HTTP status classification and URL helpers shared by the HTTP adapters.
 */

#pragma once

#include "domain/TranscriptionError.hpp"

#include <string>

namespace scribeline::infrastructure {

/**
 * @struct UrlParts
 * @brief "scheme://host[:port]" and the path (with query) of an absolute URL.
 */
struct UrlParts {
    std::string origin;
    std::string path;
};

class HttpSupport {
public:
    /** @brief Maps an HTTP status to an error kind. 0 means no response was received. */
    static domain::ErrorKind ClassifyStatus(int status);

    /**
     * @brief Builds the error for a non-2xx response.
     * @param context What was being attempted, e.g. "upload of talk.m4a".
     */
    static domain::TranscriptionError ErrorForStatus(int status, const std::string& body, const std::string& context);

    /** @brief Error for a request that produced no response (timeout, reset, DNS). */
    static domain::TranscriptionError ErrorForTransport(const std::string& detail, const std::string& context);

    /** @throws TranscriptionError (InvalidRequest) if the URL has no scheme or host. */
    static UrlParts SplitUrl(const std::string& url);

    /** @brief Joins a base URL and an absolute path without doubling the slash. */
    static std::string JoinPath(const std::string& base, const std::string& path);

    /** @brief Percent-encodes everything except RFC 3986 unreserved characters. */
    static std::string EncodePathSegment(const std::string& segment);

    static bool IsSuccess(int status) { return status >= 200 && status < 300; }
};

} // namespace scribeline::infrastructure

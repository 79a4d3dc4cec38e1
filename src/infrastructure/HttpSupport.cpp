/**
 * @file HttpSupport.cpp
 * @brief Implementation of HttpSupport.
 */

#include "infrastructure/HttpSupport.hpp"

#include <cctype>

namespace scribeline::infrastructure {

using domain::ErrorKind;
using domain::TranscriptionError;

namespace {
constexpr std::size_t kMaxBodyInMessage = 200;
}

ErrorKind HttpSupport::ClassifyStatus(int status) {
    if (status <= 0) return ErrorKind::NetworkTransient;
    switch (status) {
        case 401:
        case 402:
        case 403:
            return ErrorKind::AuthOrBilling;
        case 400:
        case 422:
            return ErrorKind::InvalidRequest;
        case 413:
            return ErrorKind::PayloadTooLarge;
        case 415:
            return ErrorKind::UnsupportedFormat;
        case 408:
        case 429:
            return ErrorKind::NetworkTransient;
        default:
            break;
    }
    if (status >= 500 && status <= 599) return ErrorKind::NetworkTransient;
    return ErrorKind::InvalidRequest;
}

TranscriptionError HttpSupport::ErrorForStatus(int status, const std::string& body, const std::string& context) {
    std::string message = context + " failed with HTTP " + std::to_string(status);
    if (!body.empty()) {
        message += ": " + (body.size() > kMaxBodyInMessage ? body.substr(0, kMaxBodyInMessage) + "..." : body);
    }
    return TranscriptionError(ClassifyStatus(status), message);
}

TranscriptionError HttpSupport::ErrorForTransport(const std::string& detail, const std::string& context) {
    return TranscriptionError(ErrorKind::NetworkTransient, context + " failed: " + detail);
}

UrlParts HttpSupport::SplitUrl(const std::string& url) {
    const auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) {
        throw TranscriptionError(ErrorKind::InvalidRequest, "URL has no scheme: " + url);
    }
    const auto hostStart = schemeEnd + 3;
    const auto pathStart = url.find('/', hostStart);
    UrlParts parts;
    if (pathStart == std::string::npos) {
        parts.origin = url;
        parts.path = "/";
    } else {
        parts.origin = url.substr(0, pathStart);
        parts.path = url.substr(pathStart);
    }
    if (parts.origin.size() <= hostStart) {
        throw TranscriptionError(ErrorKind::InvalidRequest, "URL has no host: " + url);
    }
    return parts;
}

std::string HttpSupport::JoinPath(const std::string& base, const std::string& path) {
    std::string trimmed = base;
    while (!trimmed.empty() && trimmed.back() == '/') {
        trimmed.pop_back();
    }
    if (path.empty() || path.front() != '/') {
        return trimmed + "/" + path;
    }
    return trimmed + path;
}

std::string HttpSupport::EncodePathSegment(const std::string& segment) {
    static const char* kHex = "0123456789ABCDEF";
    std::string out;
    out.reserve(segment.size());
    for (unsigned char c : segment) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += kHex[c >> 4];
            out += kHex[c & 0x0F];
        }
    }
    return out;
}

} // namespace scribeline::infrastructure

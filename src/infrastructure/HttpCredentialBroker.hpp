/**
 * @file HttpCredentialBroker.hpp
 * @brief CredentialBroker backed by the trusted backend's REST endpoint.
 */

#pragma once

#include "domain/CredentialBroker.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace scribeline::infrastructure {

class HttpCredentialBroker : public domain::CredentialBroker {
public:
    explicit HttpCredentialBroker(std::string baseUrl, int timeoutSeconds = 30);

    /** @brief POST /credentials {fileName, fileSize, mimeType}. */
    domain::CredentialResponse requestUploadCredential(const domain::SourceFile& fileMeta) override;

    static nlohmann::json BuildRequest(const domain::SourceFile& fileMeta);

    /**
     * @brief Parses a 2xx response body: {uploadUrl, authToken} or
     * {fallback, message, maxFallbackSizeBytes}. Exposed for tests.
     * @throws TranscriptionError (InvalidRequest) for any other shape.
     */
    static domain::CredentialResponse ParseResponse(const std::string& body);

private:
    std::string m_baseUrl;
    int m_timeoutSeconds;
};

} // namespace scribeline::infrastructure

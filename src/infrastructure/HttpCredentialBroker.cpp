/**
 * @file HttpCredentialBroker.cpp
 * @brief Implementation of HttpCredentialBroker.
 */

#include "infrastructure/HttpCredentialBroker.hpp"

#include "infrastructure/HttpSupport.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <iostream>

namespace scribeline::infrastructure {

using json = nlohmann::json;
using domain::ErrorKind;
using domain::TranscriptionError;

namespace {
constexpr const char* kCredentialPath = "/credentials";
}

HttpCredentialBroker::HttpCredentialBroker(std::string baseUrl, int timeoutSeconds)
    : m_baseUrl(std::move(baseUrl)), m_timeoutSeconds(timeoutSeconds) {}

json HttpCredentialBroker::BuildRequest(const domain::SourceFile& fileMeta) {
    return json{
        {"fileName", fileMeta.name},
        {"fileSize", fileMeta.byteSize},
        {"mimeType", fileMeta.mimeType}
    };
}

domain::CredentialResponse HttpCredentialBroker::ParseResponse(const std::string& body) {
    std::string uploadUrl;
    std::string token;
    try {
        json data = json::parse(body);
        if (!data.is_object()) {
            throw TranscriptionError(ErrorKind::InvalidRequest, "Credential broker response is not a JSON object");
        }
        if (data.contains("fallback")) {
            if (!data["fallback"].is_string() || !data.contains("maxFallbackSizeBytes") ||
                !data["maxFallbackSizeBytes"].is_number_unsigned()) {
                throw TranscriptionError(ErrorKind::InvalidRequest,
                    "Credential broker fallback directive needs a route name and a maxFallbackSizeBytes cap");
            }
            domain::FallbackDirective directive;
            directive.reason = data["fallback"].get<std::string>();
            directive.maxFallbackSizeBytes = data["maxFallbackSizeBytes"].get<std::uint64_t>();
            directive.message = data.value("message", std::string());
            return directive;
        }
        uploadUrl = data.value("uploadUrl", std::string());
        token = data.value("authToken", std::string());
    } catch (const json::exception& e) {
        throw TranscriptionError(ErrorKind::InvalidRequest,
            std::string("Credential broker returned malformed JSON: ") + e.what());
    }

    if (uploadUrl.empty() || token.empty()) {
        throw TranscriptionError(ErrorKind::InvalidRequest,
            "Credential broker response has neither a credential nor a fallback directive");
    }
    domain::UploadCredential credential;
    credential.uploadUrl = uploadUrl;
    credential.authToken = token;
    credential.issuedAt = std::chrono::system_clock::now();
    return credential;
}

domain::CredentialResponse HttpCredentialBroker::requestUploadCredential(const domain::SourceFile& fileMeta) {
    const UrlParts parts = HttpSupport::SplitUrl(HttpSupport::JoinPath(m_baseUrl, kCredentialPath));
    httplib::Client cli(parts.origin);
    cli.set_connection_timeout(m_timeoutSeconds, 0);
    cli.set_read_timeout(m_timeoutSeconds, 0);

    const json requestData = BuildRequest(fileMeta);
    const std::string context = "Credential request for " + fileMeta.name;
    auto res = cli.Post(parts.path, requestData.dump(), "application/json");
    if (!res) {
        std::cerr << "[HttpBroker] Connection failed: " << httplib::to_string(res.error()) << std::endl;
        throw HttpSupport::ErrorForTransport(httplib::to_string(res.error()), context);
    }
    if (!HttpSupport::IsSuccess(res->status)) {
        std::cerr << "[HttpBroker] HTTP Error " << res->status << " for " << fileMeta.name << std::endl;
        throw HttpSupport::ErrorForStatus(res->status, res->body, context);
    }
    return ParseResponse(res->body);
}

} // namespace scribeline::infrastructure

/**
 * @file HttpTranscriptionProvider.cpp
 * @brief Implementation of HttpTranscriptionProvider.
 */

#include "infrastructure/HttpTranscriptionProvider.hpp"

#include "infrastructure/HttpSupport.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <iostream>

namespace scribeline::infrastructure {

using json = nlohmann::json;
using domain::ErrorKind;
using domain::TranscriptionError;

namespace {
constexpr const char* kJobPath = "/jobs";
constexpr const char* kFallbackPath = "/fallback-transcribe";
constexpr int kConnectTimeoutSeconds = 10;
constexpr int kStatusTimeoutSeconds = 30;

json ParseObject(const std::string& body, const std::string& what) {
    json data;
    try {
        data = json::parse(body);
    } catch (const json::exception& e) {
        throw TranscriptionError(ErrorKind::InvalidRequest, what + " returned malformed JSON: " + e.what());
    }
    if (!data.is_object()) {
        throw TranscriptionError(ErrorKind::InvalidRequest, what + " response is not a JSON object");
    }
    return data;
}

// Throws the classified error for a missing or non-2xx response.
void CheckResponse(const httplib::Result& res, const std::string& context) {
    if (!res) {
        std::cerr << "[HttpProvider] Connection failed: " << httplib::to_string(res.error()) << std::endl;
        throw HttpSupport::ErrorForTransport(httplib::to_string(res.error()), context);
    }
    if (!HttpSupport::IsSuccess(res->status)) {
        std::cerr << "[HttpProvider] HTTP Error " << res->status << " during " << context << std::endl;
        throw HttpSupport::ErrorForStatus(res->status, res->body, context);
    }
}

} // namespace

HttpTranscriptionProvider::HttpTranscriptionProvider(std::string providerBaseUrl, std::string fallbackBaseUrl)
    : m_providerBaseUrl(std::move(providerBaseUrl)), m_fallbackBaseUrl(std::move(fallbackBaseUrl)) {}

json HttpTranscriptionProvider::BuildJobRequest(const std::string& audioRef, bool speakerLabels) {
    return json{
        {"audioRef", audioRef},
        {"speakerLabels", speakerLabels}
    };
}

std::string HttpTranscriptionProvider::JobStatusPath(const std::string& jobId) {
    return std::string(kJobPath) + "/" + HttpSupport::EncodePathSegment(jobId);
}

domain::UploadReceipt HttpTranscriptionProvider::ParseUploadReceipt(const std::string& body) {
    json data = ParseObject(body, "Upload");
    domain::UploadReceipt receipt;
    try {
        receipt.uploadedUrl = data.value("uploadedUrl", std::string());
        // Chunk uploads also return that chunk's partial transcript.
        if (data.contains("transcriptText") && data["transcriptText"].is_string()) {
            receipt.transcriptText = data["transcriptText"].get<std::string>();
        }
        if (data.contains("durationSeconds") && data["durationSeconds"].is_number()) {
            receipt.durationSeconds = data["durationSeconds"].get<double>();
        }
    } catch (const json::exception& e) {
        throw TranscriptionError(ErrorKind::InvalidRequest, std::string("Unexpected upload response: ") + e.what());
    }
    if (receipt.uploadedUrl.empty() && !receipt.transcriptText) {
        throw TranscriptionError(ErrorKind::InvalidRequest, "Upload response carries neither an audio URL nor a transcript");
    }
    return receipt;
}

domain::UploadReceipt HttpTranscriptionProvider::ParseFallbackResult(const std::string& body) {
    json data = ParseObject(body, "Fallback transcription");
    if (!data.contains("transcriptText") || !data["transcriptText"].is_string()) {
        throw TranscriptionError(ErrorKind::InvalidRequest, "Fallback transcription response has no transcriptText");
    }
    domain::UploadReceipt receipt;
    receipt.transcriptText = data["transcriptText"].get<std::string>();
    if (data.contains("durationSeconds") && data["durationSeconds"].is_number()) {
        receipt.durationSeconds = data["durationSeconds"].get<double>();
    }
    return receipt;
}

std::string HttpTranscriptionProvider::ParseJobId(const std::string& body) {
    json data = ParseObject(body, "Job creation");
    std::string jobId;
    if (data.contains("jobId") && data["jobId"].is_string()) {
        jobId = data["jobId"].get<std::string>();
    }
    if (jobId.empty()) {
        throw TranscriptionError(ErrorKind::InvalidRequest,
            "Job creation response has no job id" +
            (data.contains("error") && data["error"].is_string() ? ": " + data["error"].get<std::string>() : std::string()));
    }
    return jobId;
}

domain::JobStatusReport HttpTranscriptionProvider::ParseJobStatus(const std::string& body) {
    json data = ParseObject(body, "Job status");
    domain::JobStatusReport report;
    try {
        const std::string status = data.value("status", std::string("queued"));
        if (status == "completed") {
            report.state = domain::ProviderJobState::Completed;
        } else if (status == "failed" || status == "error") {
            report.state = domain::ProviderJobState::Error;
        } else if (status == "queued") {
            report.state = domain::ProviderJobState::Queued;
        } else {
            report.state = domain::ProviderJobState::Processing;
        }

        if (data.contains("progressPercent") && data["progressPercent"].is_number()) {
            report.progressPercent = static_cast<int>(data["progressPercent"].get<double>());
        }
        if (data.contains("result") && data["result"].is_object()) {
            const auto& result = data["result"];
            domain::TranscriptResult transcript;
            transcript.text = result.value("text", std::string());
            transcript.durationSeconds = result.value("durationSeconds", 0.0);
            report.result = transcript;
        }
        if (data.contains("error") && data["error"].is_string()) {
            report.error = data["error"].get<std::string>();
        }
    } catch (const json::exception& e) {
        throw TranscriptionError(ErrorKind::InvalidRequest, std::string("Unexpected job status response: ") + e.what());
    }
    return report;
}

domain::UploadReceipt HttpTranscriptionProvider::upload(const domain::UploadCredential& credential,
                                                        const std::string& payload,
                                                        const std::string& mimeType,
                                                        std::chrono::seconds timeout) {
    const UrlParts parts = HttpSupport::SplitUrl(credential.uploadUrl);
    httplib::Client cli(parts.origin);
    cli.set_connection_timeout(kConnectTimeoutSeconds, 0);
    cli.set_read_timeout(static_cast<time_t>(timeout.count()), 0);
    cli.set_write_timeout(static_cast<time_t>(timeout.count()), 0);

    httplib::Headers headers = {
        {"Authorization", credential.authToken}
    };

    std::cout << "[HttpProvider] Uploading " << payload.size() << " bytes (timeout " << timeout.count() << "s)"
              << std::endl;
    auto res = cli.Post(parts.path, headers, payload, mimeType);
    CheckResponse(res, "Upload");
    return ParseUploadReceipt(res->body);
}

std::string HttpTranscriptionProvider::createJob(const std::string& audioRef, bool speakerLabels) {
    const UrlParts parts = HttpSupport::SplitUrl(HttpSupport::JoinPath(m_providerBaseUrl, kJobPath));
    httplib::Client cli(parts.origin);
    cli.set_connection_timeout(kConnectTimeoutSeconds, 0);
    cli.set_read_timeout(kStatusTimeoutSeconds, 0);

    auto res = cli.Post(parts.path, BuildJobRequest(audioRef, speakerLabels).dump(), "application/json");
    CheckResponse(res, "Job creation");
    return ParseJobId(res->body);
}

domain::JobStatusReport HttpTranscriptionProvider::getJobStatus(const std::string& jobId) {
    const UrlParts parts = HttpSupport::SplitUrl(HttpSupport::JoinPath(m_providerBaseUrl, JobStatusPath(jobId)));
    httplib::Client cli(parts.origin);
    cli.set_connection_timeout(kConnectTimeoutSeconds, 0);
    cli.set_read_timeout(kStatusTimeoutSeconds, 0);

    auto res = cli.Get(parts.path);
    CheckResponse(res, "Status check for job " + jobId);
    return ParseJobStatus(res->body);
}

domain::UploadReceipt HttpTranscriptionProvider::transcribeFallback(const domain::SourceFile& fileMeta,
                                                                    const std::string& payload,
                                                                    std::chrono::seconds timeout) {
    const UrlParts parts = HttpSupport::SplitUrl(HttpSupport::JoinPath(m_fallbackBaseUrl, kFallbackPath));
    httplib::Client cli(parts.origin);
    cli.set_connection_timeout(kConnectTimeoutSeconds, 0);
    cli.set_read_timeout(static_cast<time_t>(timeout.count()), 0);
    cli.set_write_timeout(static_cast<time_t>(timeout.count()), 0);

    httplib::MultipartFormDataItems items = {
        {"audio", payload, fileMeta.name, fileMeta.mimeType},
        {"fileName", fileMeta.name, "", ""}
    };

    std::cout << "[HttpProvider] Fallback transcription of " << fileMeta.name << std::endl;
    auto res = cli.Post(parts.path, items);
    CheckResponse(res, "Fallback transcription of " + fileMeta.name);
    return ParseFallbackResult(res->body);
}

} // namespace scribeline::infrastructure

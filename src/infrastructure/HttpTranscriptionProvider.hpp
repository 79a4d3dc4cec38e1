/**
 * @file HttpTranscriptionProvider.hpp
 * @brief TranscriptionProvider speaking to the upload URL, the job API and the fallback endpoint.
 */

#pragma once

#include "domain/TranscriptionProvider.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace scribeline::infrastructure {

/**
 * @class HttpTranscriptionProvider
 * @brief One short-lived httplib client per request, like every other HTTP call in the codebase.
 *
 * Routes:
 *  - upload: POST to the credential's uploadUrl with the raw bytes -> {uploadedUrl}.
 *  - createJob: POST {providerBaseUrl}/jobs {audioRef, speakerLabels} -> {jobId}.
 *  - getJobStatus: GET {providerBaseUrl}/jobs/{jobId} -> {status, progressPercent?, result?, error?}.
 *  - transcribeFallback: multipart POST {fallbackBaseUrl}/fallback-transcribe -> {transcriptText, durationSeconds}.
 */
class HttpTranscriptionProvider : public domain::TranscriptionProvider {
public:
    HttpTranscriptionProvider(std::string providerBaseUrl, std::string fallbackBaseUrl);

    domain::UploadReceipt upload(const domain::UploadCredential& credential,
                                 const std::string& payload,
                                 const std::string& mimeType,
                                 std::chrono::seconds timeout) override;

    std::string createJob(const std::string& audioRef, bool speakerLabels) override;

    domain::JobStatusReport getJobStatus(const std::string& jobId) override;

    domain::UploadReceipt transcribeFallback(const domain::SourceFile& fileMeta,
                                             const std::string& payload,
                                             std::chrono::seconds timeout) override;

    static nlohmann::json BuildJobRequest(const std::string& audioRef, bool speakerLabels);
    /** @brief "/jobs/<jobId>" with the id percent-encoded. */
    static std::string JobStatusPath(const std::string& jobId);

    // Body parsers, exposed for tests.
    static domain::UploadReceipt ParseUploadReceipt(const std::string& body);
    /** @throws TranscriptionError (InvalidRequest) when transcriptText is missing. */
    static domain::UploadReceipt ParseFallbackResult(const std::string& body);
    static domain::JobStatusReport ParseJobStatus(const std::string& body);
    static std::string ParseJobId(const std::string& body);

private:
    std::string m_providerBaseUrl;
    std::string m_fallbackBaseUrl;
};

} // namespace scribeline::infrastructure

/**
 * @file TranscriptionProvider.hpp
 * @brief Interface for the external transcription service (primary and fallback routes).
 */

#pragma once

#include "domain/TranscriptionJob.hpp"
#include "domain/UploadCredential.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace scribeline::domain {

/**
 * @struct UploadReceipt
 * @brief What the provider returns for one transferred payload.
 *
 * A whole-file primary upload yields only uploadedUrl. Chunk uploads and the fallback
 * route also return the transcript of the payload and its duration.
 */
struct UploadReceipt {
    std::string uploadedUrl;
    std::optional<std::string> transcriptText;
    std::optional<double> durationSeconds;
};

/**
 * @enum ProviderJobState
 * @brief Status vocabulary of the provider's job-status endpoint.
 */
enum class ProviderJobState {
    Queued,
    Processing,
    Completed,
    Error
};

/**
 * @struct JobStatusReport
 * @brief One answer of the job-status endpoint.
 */
struct JobStatusReport {
    ProviderJobState state = ProviderJobState::Queued;
    std::optional<int> progressPercent;      ///< Provider-side progress if reported.
    std::optional<TranscriptResult> result;  ///< Present once state is Completed.
    std::string error;                       ///< Provider reason when state is Error.
};

/**
 * @class TranscriptionProvider
 * @brief Transport-level operations against the transcription service.
 *
 * Every operation throws TranscriptionError on failure; the kind tells the caller
 * whether the failure may be retried.
 */
class TranscriptionProvider {
public:
    virtual ~TranscriptionProvider() = default;

    /**
     * @brief Uploads raw bytes to the URL named by a credential.
     * @param timeout Upper bound for the whole transfer.
     */
    virtual UploadReceipt upload(const UploadCredential& credential,
                                 const std::string& payload,
                                 const std::string& mimeType,
                                 std::chrono::seconds timeout) = 0;

    /** @brief Starts an asynchronous transcription job for previously uploaded audio. */
    virtual std::string createJob(const std::string& audioRef, bool speakerLabels) = 0;

    /** @brief Reads the current status of a job. */
    virtual JobStatusReport getJobStatus(const std::string& jobId) = 0;

    /** @brief Synchronous fallback transcription; the transcript comes back in the receipt. */
    virtual UploadReceipt transcribeFallback(const SourceFile& fileMeta,
                                             const std::string& payload,
                                             std::chrono::seconds timeout) = 0;
};

} // namespace scribeline::domain

/**
 * @file UploadOrchestrator.hpp
 * @brief Executes single-shot and chunked transfers with bounded retries and backoff.
 */

#pragma once

#include "application/PipelineConfig.hpp"
#include "domain/MediaSource.hpp"
#include "domain/Scheduler.hpp"
#include "domain/TranscriptionError.hpp"
#include "domain/TranscriptionProvider.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace scribeline::application {

/**
 * @struct AttemptReport
 * @brief Outcome of one transfer attempt, reported whether it succeeded or will be retried.
 */
struct AttemptReport {
    std::string label;          ///< File or chunk name.
    int attempt = 0;            ///< Zero-based attempt index.
    int maxAttempts = 0;
    bool succeeded = false;
    std::chrono::seconds timeout{0};
    std::optional<domain::TranscriptionError> error;
    std::optional<std::chrono::seconds> nextDelay; ///< Set when another attempt is scheduled.
};

/**
 * @class UploadOrchestrator
 * @brief Runs transfers on the scheduler. At most one attempt per transfer is in flight.
 *
 * Only NetworkTransient failures are retried. The wait before attempt n (n >= 1) is 2^n seconds
 * and the per-attempt timeout grows with the payload size.
 */
class UploadOrchestrator {
public:
    using AttemptFn = std::function<domain::UploadReceipt(std::chrono::seconds timeout)>;
    using OnAttempt = std::function<void(const AttemptReport&)>;
    using OnSuccess = std::function<void(const domain::UploadReceipt&)>;
    using OnError = std::function<void(const domain::TranscriptionError&)>;
    using CredentialSource = std::function<domain::UploadCredential(const domain::ChunkTask&)>;
    using OnChunkDone = std::function<void(const domain::ChunkTask&, const domain::UploadReceipt&)>;
    using OnChunksDone = std::function<void(const std::vector<domain::UploadReceipt>&)>;

    UploadOrchestrator(domain::TranscriptionProvider& provider,
                       domain::Scheduler& scheduler,
                       UploadPolicy policy);

    /** @brief Observer invoked after every attempt, successful or not. */
    void setAttemptObserver(OnAttempt observer);

    static std::chrono::seconds ComputeTimeout(std::uint64_t sizeBytes, const UploadPolicy& policy);

    /** @brief Delay before the zero-based attempt index; zero for the first attempt. */
    static std::chrono::seconds BackoffBefore(int attemptIndex);

    /**
     * @brief Runs an arbitrary transfer under the retry policy.
     * @param label Name used in logs and attempt reports.
     * @param sizeBytes Payload size, drives the per-attempt timeout.
     * @param attempt Performs one attempt, throwing TranscriptionError on failure.
     */
    void transfer(const std::string& label,
                  std::uint64_t sizeBytes,
                  AttemptFn attempt,
                  OnSuccess onSuccess,
                  OnError onError);

    /** @brief Uploads one payload to the primary provider with a credential. */
    void uploadPayload(const domain::UploadCredential& credential,
                       std::shared_ptr<const std::string> payload,
                       const std::string& mimeType,
                       const std::string& label,
                       OnSuccess onSuccess,
                       OnError onError);

    /**
     * @brief Uploads chunks strictly in order; chunk i+1 starts only after chunk i succeeded.
     *
     * Each chunk is read from the source just before its transfer and gets its own credential.
     * The first failure that exhausts its retries aborts the whole sequence.
     */
    void uploadChunks(std::shared_ptr<const domain::MediaSource> source,
                      std::vector<domain::ChunkTask> chunks,
                      CredentialSource credentialFor,
                      OnChunkDone onChunk,
                      OnChunksDone onSuccess,
                      OnError onError);

    /** @brief Drops the pending retry, if any. Callbacks of in-progress transfers are never invoked. */
    void cancel();

    /** @brief True while a retry is waiting on the scheduler. */
    bool hasPendingRetry() const { return m_pendingTask.has_value(); }

private:
    struct TransferState;
    struct ChunkRun;

    void runAttempt(const std::shared_ptr<TransferState>& state);
    void uploadNextChunk(const std::shared_ptr<ChunkRun>& run);
    void report(const AttemptReport& attempt);

    domain::TranscriptionProvider& m_provider;
    domain::Scheduler& m_scheduler;
    UploadPolicy m_policy;
    OnAttempt m_attemptObserver;
    std::optional<domain::Scheduler::TaskId> m_pendingTask;
    std::uint64_t m_generation = 0;
};

} // namespace scribeline::application

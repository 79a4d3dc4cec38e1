/**
 * @file UploadOrchestrator.cpp
 * @brief Implementation of UploadOrchestrator.
 */

#include "application/UploadOrchestrator.hpp"

#include <algorithm>
#include <iostream>

namespace scribeline::application {

using domain::ErrorKind;
using domain::TranscriptionError;

struct UploadOrchestrator::TransferState {
    std::string label;
    std::uint64_t sizeBytes = 0;
    AttemptFn attempt;
    OnSuccess onSuccess;
    OnError onError;
    int attemptIndex = 0;
    std::uint64_t generation = 0;
};

struct UploadOrchestrator::ChunkRun {
    std::shared_ptr<const domain::MediaSource> source;
    std::string mimeType;
    std::vector<domain::ChunkTask> chunks;
    CredentialSource credentialFor;
    OnChunkDone onChunk;
    OnChunksDone onSuccess;
    OnError onError;
    std::vector<domain::UploadReceipt> receipts;
    std::size_t next = 0;
    std::uint64_t generation = 0;
};

UploadOrchestrator::UploadOrchestrator(domain::TranscriptionProvider& provider,
                                       domain::Scheduler& scheduler,
                                       UploadPolicy policy)
    : m_provider(provider), m_scheduler(scheduler), m_policy(policy) {
    if (m_policy.maxAttempts < 1) {
        m_policy.maxAttempts = 1;
    }
}

void UploadOrchestrator::setAttemptObserver(OnAttempt observer) {
    m_attemptObserver = std::move(observer);
}

std::chrono::seconds UploadOrchestrator::ComputeTimeout(std::uint64_t sizeBytes, const UploadPolicy& policy) {
    const std::uint64_t throughput = std::max<std::uint64_t>(1, policy.minThroughputBytesPerSecond);
    const auto transferSeconds = static_cast<long long>((sizeBytes + throughput - 1) / throughput);
    const std::chrono::seconds scaled{transferSeconds + policy.timeoutBuffer.count()};
    return std::max(policy.timeoutFloor, scaled);
}

std::chrono::seconds UploadOrchestrator::BackoffBefore(int attemptIndex) {
    if (attemptIndex <= 0) return std::chrono::seconds{0};
    return std::chrono::seconds{1LL << std::min(attemptIndex, 30)};
}

void UploadOrchestrator::transfer(const std::string& label,
                                  std::uint64_t sizeBytes,
                                  AttemptFn attempt,
                                  OnSuccess onSuccess,
                                  OnError onError) {
    auto state = std::make_shared<TransferState>();
    state->label = label;
    state->sizeBytes = sizeBytes;
    state->attempt = std::move(attempt);
    state->onSuccess = std::move(onSuccess);
    state->onError = std::move(onError);
    state->generation = m_generation;
    runAttempt(state);
}

void UploadOrchestrator::uploadPayload(const domain::UploadCredential& credential,
                                       std::shared_ptr<const std::string> payload,
                                       const std::string& mimeType,
                                       const std::string& label,
                                       OnSuccess onSuccess,
                                       OnError onError) {
    const std::uint64_t size = payload ? payload->size() : 0;
    transfer(label, size,
        [this, credential, payload, mimeType](std::chrono::seconds timeout) {
            return m_provider.upload(credential, *payload, mimeType, timeout);
        },
        std::move(onSuccess), std::move(onError));
}

void UploadOrchestrator::runAttempt(const std::shared_ptr<TransferState>& state) {
    if (state->generation != m_generation) {
        return;
    }
    m_pendingTask.reset();

    AttemptReport attempt;
    attempt.label = state->label;
    attempt.attempt = state->attemptIndex;
    attempt.maxAttempts = m_policy.maxAttempts;
    attempt.timeout = ComputeTimeout(state->sizeBytes, m_policy);

    std::optional<domain::UploadReceipt> receipt;
    std::optional<TranscriptionError> failure;
    try {
        receipt = state->attempt(attempt.timeout);
    } catch (const TranscriptionError& e) {
        failure = e;
    } catch (const std::exception& e) {
        failure = TranscriptionError(ErrorKind::InvalidRequest, e.what());
    }

    if (receipt) {
        attempt.succeeded = true;
        report(attempt);
        if (state->generation == m_generation) {
            state->onSuccess(*receipt);
        }
        return;
    }

    attempt.error = failure;
    const bool lastAttempt = state->attemptIndex + 1 >= m_policy.maxAttempts;
    if (!failure->retryable() || lastAttempt) {
        report(attempt);
        if (state->generation != m_generation) {
            return;
        }
        if (failure->retryable()) {
            std::cerr << "[UploadOrchestrator] " << state->label << ": giving up after "
                      << m_policy.maxAttempts << " attempts" << std::endl;
            state->onError(TranscriptionError(ErrorKind::NetworkTransient,
                std::string(failure->what()) + " (after " + std::to_string(m_policy.maxAttempts) + " attempts)"));
        } else {
            state->onError(*failure);
        }
        return;
    }

    state->attemptIndex += 1;
    const auto delay = BackoffBefore(state->attemptIndex);
    attempt.nextDelay = delay;
    std::cerr << "[UploadOrchestrator] " << state->label << ": attempt " << (attempt.attempt + 1)
              << "/" << m_policy.maxAttempts << " failed (" << failure->describe()
              << "), retrying in " << delay.count() << "s" << std::endl;
    report(attempt);
    if (state->generation != m_generation) {
        return;
    }
    m_pendingTask = m_scheduler.schedule(delay, [this, state]() { runAttempt(state); });
}

void UploadOrchestrator::uploadChunks(std::shared_ptr<const domain::MediaSource> source,
                                      std::vector<domain::ChunkTask> chunks,
                                      CredentialSource credentialFor,
                                      OnChunkDone onChunk,
                                      OnChunksDone onSuccess,
                                      OnError onError) {
    auto run = std::make_shared<ChunkRun>();
    run->mimeType = source->describe().mimeType;
    run->source = std::move(source);
    run->chunks = std::move(chunks);
    run->credentialFor = std::move(credentialFor);
    run->onChunk = std::move(onChunk);
    run->onSuccess = std::move(onSuccess);
    run->onError = std::move(onError);
    run->generation = m_generation;
    uploadNextChunk(run);
}

void UploadOrchestrator::uploadNextChunk(const std::shared_ptr<ChunkRun>& run) {
    if (run->generation != m_generation) {
        return;
    }
    if (run->next >= run->chunks.size()) {
        run->onSuccess(run->receipts);
        return;
    }

    const domain::ChunkTask chunk = run->chunks[run->next];
    std::shared_ptr<const std::string> payload;
    domain::UploadCredential credential;
    try {
        payload = std::make_shared<const std::string>(run->source->read(chunk.byteStart, chunk.length()));
        credential = run->credentialFor(chunk);
    } catch (const TranscriptionError& e) {
        run->onError(e);
        return;
    }

    std::cout << "[UploadOrchestrator] Uploading " << chunk.derivedFilename << " ("
              << chunk.length() << " bytes)" << std::endl;

    uploadPayload(credential, payload, run->mimeType, chunk.derivedFilename,
        [this, run, chunk](const domain::UploadReceipt& receipt) {
            if (!receipt.transcriptText) {
                run->onError(TranscriptionError(ErrorKind::InvalidRequest,
                    "Provider returned no transcript for " + chunk.derivedFilename));
                return;
            }
            run->receipts.push_back(receipt);
            run->next += 1;
            run->onChunk(chunk, receipt);
            if (run->generation != m_generation) {
                return;
            }
            m_pendingTask = m_scheduler.schedule(std::chrono::milliseconds{0},
                [this, run]() {
                    m_pendingTask.reset();
                    uploadNextChunk(run);
                });
        },
        run->onError);
}

void UploadOrchestrator::cancel() {
    ++m_generation;
    if (m_pendingTask) {
        m_scheduler.cancel(*m_pendingTask);
        m_pendingTask.reset();
    }
}

void UploadOrchestrator::report(const AttemptReport& attempt) {
    if (m_attemptObserver) {
        m_attemptObserver(attempt);
    }
}

} // namespace scribeline::application

/**
 * @file TranscriptionPipeline.hpp
 * @brief Drives one transcription job from file selection to its terminal state.
 */

#pragma once

#include "application/JobPoller.hpp"
#include "application/PipelineConfig.hpp"
#include "application/ProviderFallbackController.hpp"
#include "application/UploadOrchestrator.hpp"
#include "domain/ChunkPlanner.hpp"
#include "domain/CredentialBroker.hpp"
#include "domain/JobStateMachine.hpp"
#include "domain/MediaSource.hpp"
#include "domain/ProgressStateStore.hpp"
#include "domain/Scheduler.hpp"
#include "domain/TranscriptionProvider.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace scribeline::application {

/**
 * @struct JobOutcome
 * @brief Terminal result of one job. Exactly one of result and error is set.
 */
struct JobOutcome {
    domain::TranscriptionJob job;
    std::optional<domain::TranscriptResult> result;
    std::optional<domain::TranscriptionError> error;

    bool succeeded() const { return result.has_value(); }
};

/**
 * @class TranscriptionPipeline
 * @brief Owns the active job slot, its upload orchestrator and its poller.
 *
 * Every state change goes through JobStateMachine::apply; this class only executes the
 * effects a transition asks for. One job at a time: submit() refuses while a job is active.
 * All work runs on the injected scheduler.
 */
class TranscriptionPipeline {
public:
    using OnFinished = std::function<void(const JobOutcome&)>;
    using OnProgress = std::function<void(const domain::TranscriptionJob&)>;

    TranscriptionPipeline(PipelineConfig config,
                          domain::CredentialBroker& broker,
                          domain::TranscriptionProvider& provider,
                          domain::ProgressStateStore& store,
                          domain::Scheduler& scheduler);

    void setProgressObserver(OnProgress observer);

    /**
     * @brief Queues a file. Work starts on the next scheduler turn.
     * @return False if another job is still active.
     */
    bool submit(std::shared_ptr<const domain::MediaSource> source, OnFinished onFinished);

    /**
     * @brief Picks up the persisted job, if any.
     * @return True if a persisted in-flight record was found and is being handled.
     */
    bool resume(OnFinished onFinished);

    /** @brief Stops the active job. It finishes as failed with a Cancelled error. */
    void cancel();

    bool isBusy() const { return m_busy; }
    const domain::TranscriptionJob& currentJob() const { return m_job; }
    std::size_t finalizedCount() const { return m_finalizedCount; }

private:
    void begin();
    void runPrimary(const domain::UploadCredential& credential);
    void runChunked();
    void runFallback();

    bool dispatch(const domain::JobEvent& event);
    void runEffects(const std::vector<domain::Effect>& effects);
    void persist();
    void clearStore();
    void notify();
    void startPolling();
    void deliverOutcome();

    void succeed(domain::TranscriptResult result);
    void fail(const domain::TranscriptionError& error);
    void resetSlot(OnFinished onFinished);

    PipelineConfig m_config;
    domain::CredentialBroker& m_broker;
    domain::TranscriptionProvider& m_provider;
    domain::ProgressStateStore& m_store;
    domain::Scheduler& m_scheduler;
    UploadOrchestrator m_uploader;
    JobPoller m_poller;
    ProviderFallbackController m_fallback;
    OnProgress m_observer;

    domain::TranscriptionJob m_job;
    std::shared_ptr<const domain::MediaSource> m_source;
    OnFinished m_onFinished;
    std::optional<domain::TranscriptResult> m_result;
    std::optional<domain::TranscriptionError> m_error;
    std::optional<domain::Scheduler::TaskId> m_beginTask;
    bool m_busy = false;
    std::size_t m_finalizedCount = 0;
};

} // namespace scribeline::application

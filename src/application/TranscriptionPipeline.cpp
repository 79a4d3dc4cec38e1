/**
 * @file TranscriptionPipeline.cpp
 * @brief Implementation of TranscriptionPipeline.
 */

#include "application/TranscriptionPipeline.hpp"

#include "application/EtaEstimator.hpp"
#include "domain/MediaTypes.hpp"

#include <iostream>
#include <variant>

namespace scribeline::application {

using domain::ErrorKind;
using domain::TranscriptionError;
namespace events = domain::events;

namespace {

std::chrono::system_clock::time_point WallNow() {
    return std::chrono::system_clock::now();
}

} // namespace

TranscriptionPipeline::TranscriptionPipeline(PipelineConfig config,
                                             domain::CredentialBroker& broker,
                                             domain::TranscriptionProvider& provider,
                                             domain::ProgressStateStore& store,
                                             domain::Scheduler& scheduler)
    : m_config(std::move(config)),
      m_broker(broker),
      m_provider(provider),
      m_store(store),
      m_scheduler(scheduler),
      m_uploader(provider, scheduler, m_config.upload),
      m_poller(provider, scheduler, m_config.poller),
      m_fallback(m_config.chunking.directUploadThresholdBytes) {
    m_uploader.setAttemptObserver([this](const AttemptReport& attempt) {
        if (!m_busy) return;
        if (attempt.succeeded) {
            std::cout << "[Pipeline] " << attempt.label << " transferred on attempt "
                      << (attempt.attempt + 1) << "/" << attempt.maxAttempts << std::endl;
        }
        persist();
        notify();
    });
}

void TranscriptionPipeline::setProgressObserver(OnProgress observer) {
    m_observer = std::move(observer);
}

void TranscriptionPipeline::resetSlot(OnFinished onFinished) {
    m_job = domain::TranscriptionJob{};
    m_source.reset();
    m_onFinished = std::move(onFinished);
    m_result.reset();
    m_error.reset();
    m_busy = true;
}

bool TranscriptionPipeline::submit(std::shared_ptr<const domain::MediaSource> source, OnFinished onFinished) {
    if (m_busy) {
        std::cerr << "[Pipeline] Rejected submission: job for " << m_job.sourceFile.name
                  << " is still active" << std::endl;
        return false;
    }
    if (!source) {
        throw std::invalid_argument("TranscriptionPipeline::submit requires a media source");
    }
    resetSlot(std::move(onFinished));
    m_source = std::move(source);
    m_job.sourceFile = m_source->describe();

    m_beginTask = m_scheduler.schedule(std::chrono::milliseconds{0}, [this]() {
        m_beginTask.reset();
        begin();
    });
    return true;
}

void TranscriptionPipeline::begin() {
    const domain::SourceFile file = m_job.sourceFile;
    domain::UploadPlan plan;
    try {
        domain::ChunkPlanner::ValidateSource(file, m_source->isReadable());
        if (!domain::IsSupportedMediaType(file.mimeType, file.name)) {
            throw TranscriptionError(ErrorKind::UnsupportedFormat,
                "Unsupported media type '" + file.mimeType + "' for " + file.name);
        }
        if (file.byteSize > m_config.maxFileSizeBytes) {
            throw TranscriptionError(ErrorKind::PayloadTooLarge,
                file.name + " is " + std::to_string(file.byteSize) + " bytes; the provider accepts at most " +
                std::to_string(m_config.maxFileSizeBytes) + " bytes");
        }
        plan = domain::ChunkPlanner::Plan(file, m_config.chunking);
    } catch (const TranscriptionError& e) {
        fail(e);
        return;
    }

    if (plan.chunked) {
        m_job.chunks = plan.chunks;
    }
    std::cout << "[Pipeline] " << file.name << " (" << file.byteSize << " bytes): "
              << (plan.chunked ? std::to_string(plan.chunks.size()) + " chunks" : std::string("single upload"))
              << std::endl;
    dispatch(events::Submitted{plan.chunked, EtaEstimator::InitialEstimate(file.byteSize), WallNow()});

    RouteDecision decision;
    try {
        decision = m_fallback.decide(m_broker.requestUploadCredential(file), file);
    } catch (const TranscriptionError& e) {
        fail(e);
        return;
    }

    if (decision.provider == domain::Provider::Fallback) {
        runFallback();
    } else if (plan.chunked) {
        runChunked();
    } else {
        runPrimary(*decision.credential);
    }
}

void TranscriptionPipeline::runPrimary(const domain::UploadCredential& credential) {
    std::shared_ptr<const std::string> payload;
    try {
        payload = std::make_shared<const std::string>(m_source->read(0, m_job.sourceFile.byteSize));
    } catch (const TranscriptionError& e) {
        fail(e);
        return;
    }
    dispatch(events::UploadStarted{domain::Provider::Primary});

    m_uploader.uploadPayload(credential, payload, m_job.sourceFile.mimeType, m_job.sourceFile.name,
        [this](const domain::UploadReceipt& receipt) {
            std::string jobId;
            try {
                jobId = m_provider.createJob(receipt.uploadedUrl, m_config.speakerLabels);
            } catch (const TranscriptionError& e) {
                fail(e);
                return;
            }
            std::cout << "[Pipeline] Provider accepted " << m_job.sourceFile.name << " as job " << jobId << std::endl;
            if (!dispatch(events::JobCreated{jobId})) {
                fail(TranscriptionError(ErrorKind::InvalidRequest, "Provider returned an empty job id"));
            }
        },
        [this](const TranscriptionError& e) { fail(e); });
}

void TranscriptionPipeline::runChunked() {
    dispatch(events::UploadStarted{domain::Provider::Primary});
    const std::string mimeType = m_job.sourceFile.mimeType;
    const std::size_t total = m_job.chunks.size();

    m_uploader.uploadChunks(m_source, m_job.chunks,
        [this, mimeType](const domain::ChunkTask& chunk) {
            domain::SourceFile meta{chunk.derivedFilename, chunk.length(), mimeType};
            auto response = m_broker.requestUploadCredential(meta);
            if (const auto* credential = std::get_if<domain::UploadCredential>(&response)) {
                return *credential;
            }
            throw TranscriptionError(ErrorKind::NetworkTransient,
                "Primary provider became unavailable while uploading " + chunk.derivedFilename);
        },
        [this, total](const domain::ChunkTask& chunk, const domain::UploadReceipt&) {
            dispatch(events::ChunkUploaded{chunk.index, total});
        },
        [this](const std::vector<domain::UploadReceipt>& receipts) {
            dispatch(events::ChunksUploaded{});
            domain::TranscriptResult combined;
            for (const auto& receipt : receipts) {
                combined.text += receipt.transcriptText.value_or("");
                combined.durationSeconds += receipt.durationSeconds.value_or(0.0);
            }
            succeed(std::move(combined));
        },
        [this](const TranscriptionError& e) { fail(e); });
}

void TranscriptionPipeline::runFallback() {
    std::shared_ptr<const std::string> payload;
    try {
        payload = std::make_shared<const std::string>(m_source->read(0, m_job.sourceFile.byteSize));
    } catch (const TranscriptionError& e) {
        fail(e);
        return;
    }
    dispatch(events::UploadStarted{domain::Provider::Fallback});

    const domain::SourceFile file = m_job.sourceFile;
    m_uploader.transfer(file.name, payload->size(),
        [this, file, payload](std::chrono::seconds timeout) {
            return m_provider.transcribeFallback(file, *payload, timeout);
        },
        [this](const domain::UploadReceipt& receipt) {
            if (!receipt.transcriptText) {
                fail(TranscriptionError(ErrorKind::InvalidRequest, "Fallback response carried no transcript"));
                return;
            }
            succeed(domain::TranscriptResult{*receipt.transcriptText, receipt.durationSeconds.value_or(0.0)});
        },
        [this](const TranscriptionError& e) { fail(e); });
}

bool TranscriptionPipeline::resume(OnFinished onFinished) {
    if (m_busy) {
        return false;
    }
    std::optional<domain::PersistedJobState> saved;
    try {
        saved = m_store.get();
    } catch (const std::exception& e) {
        std::cerr << "[Pipeline] Could not read persisted job state: " << e.what() << std::endl;
        return false;
    }
    if (!saved) {
        return false;
    }
    if (!saved->isResumable()) {
        std::cout << "[Pipeline] Discarding finished job record for " << saved->fileName << std::endl;
        clearStore();
        return false;
    }

    resetSlot(std::move(onFinished));
    m_job.sourceFile.name = saved->fileName;
    m_job.provider = saved->provider;

    if (saved->jobId.empty()) {
        std::cerr << "[Pipeline] " << saved->fileName << " was interrupted before the provider accepted it" << std::endl;
        fail(TranscriptionError(ErrorKind::NetworkTransient,
            "Upload of " + saved->fileName + " was interrupted by a restart; resubmit the file"));
        return true;
    }

    std::cout << "[Pipeline] Resuming job " << saved->jobId << " for " << saved->fileName
              << " at " << saved->progressPercent << "%" << std::endl;
    dispatch(events::Resumed{saved->jobId, saved->progressPercent, saved->etaSeconds, saved->provider});
    return true;
}

void TranscriptionPipeline::cancel() {
    if (!m_busy) {
        return;
    }
    if (m_beginTask) {
        m_scheduler.cancel(*m_beginTask);
        m_beginTask.reset();
    }
    m_uploader.cancel();
    m_poller.cancel();
    std::cout << "[Pipeline] Cancelling job for " << m_job.sourceFile.name << std::endl;
    fail(TranscriptionError(ErrorKind::Cancelled, "Cancelled by user"));
}

void TranscriptionPipeline::succeed(domain::TranscriptResult result) {
    m_result = std::move(result);
    if (!dispatch(events::Completed{WallNow()})) {
        m_result.reset();
    }
}

void TranscriptionPipeline::fail(const TranscriptionError& error) {
    m_error = error;
    if (!dispatch(events::Failed{error, WallNow()})) {
        m_error.reset();
    }
}

bool TranscriptionPipeline::dispatch(const domain::JobEvent& event) {
    domain::Transition transition = domain::JobStateMachine::apply(m_job, event);
    if (!transition.accepted) {
        std::cerr << "[Pipeline] Ignoring " << domain::JobStateMachine::eventName(event) << " in state "
                  << domain::StatusToString(m_job.status) << std::endl;
        return false;
    }
    m_job = std::move(transition.job);
    runEffects(transition.effects);
    return true;
}

void TranscriptionPipeline::runEffects(const std::vector<domain::Effect>& effects) {
    bool finalize = false;
    for (domain::Effect effect : effects) {
        switch (effect) {
            case domain::Effect::Persist:
                persist();
                break;
            case domain::Effect::Notify:
                notify();
                break;
            case domain::Effect::StartPolling:
                startPolling();
                break;
            case domain::Effect::Finalize:
                m_uploader.cancel();
                m_poller.cancel();
                ++m_finalizedCount;
                finalize = true;
                break;
            case domain::Effect::Clear:
                clearStore();
                break;
        }
    }
    if (finalize) {
        deliverOutcome();
    }
}

void TranscriptionPipeline::persist() {
    try {
        m_store.set(domain::SnapshotOf(m_job));
    } catch (const std::exception& e) {
        std::cerr << "[Pipeline] Failed to persist progress for " << m_job.sourceFile.name << ": " << e.what() << std::endl;
    }
}

void TranscriptionPipeline::clearStore() {
    try {
        m_store.clear();
    } catch (const std::exception& e) {
        std::cerr << "[Pipeline] Failed to clear persisted progress: " << e.what() << std::endl;
    }
}

void TranscriptionPipeline::notify() {
    if (m_observer) {
        m_observer(m_job);
    }
}

void TranscriptionPipeline::startPolling() {
    const std::string jobId = m_job.id.value_or("");
    const bool started = m_poller.start(jobId, m_job.progressPercent,
        [this](const PollUpdate& update) {
            dispatch(events::ProgressReported{update.progressPercent, update.etaSeconds});
        },
        [this](const std::string&, const domain::TranscriptResult& result) {
            succeed(result);
        },
        [this](const std::string&, const TranscriptionError& error) {
            fail(error);
        });
    if (!started) {
        fail(TranscriptionError(ErrorKind::JobFailed, "Job " + jobId + " was already finalized"));
    }
}

void TranscriptionPipeline::deliverOutcome() {
    JobOutcome outcome{m_job, m_result, m_error};
    OnFinished callback = std::move(m_onFinished);
    m_onFinished = nullptr;
    m_source.reset();
    m_busy = false;

    if (outcome.succeeded()) {
        std::cout << "[Pipeline] " << outcome.job.sourceFile.name << " completed ("
                  << outcome.result->text.size() << " chars, " << outcome.result->durationSeconds << "s audio)"
                  << std::endl;
    } else if (outcome.error) {
        std::cerr << "[Pipeline] " << outcome.job.sourceFile.name << " failed: " << outcome.error->describe()
                  << std::endl;
    }
    if (callback) {
        callback(outcome);
    }
}

} // namespace scribeline::application

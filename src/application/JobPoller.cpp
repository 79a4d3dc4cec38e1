/**
 * @file JobPoller.cpp
 * @brief Implementation of JobPoller.
 */

#include "application/JobPoller.hpp"

#include "application/EtaEstimator.hpp"
#include "domain/JobStateMachine.hpp"

#include <algorithm>
#include <iostream>

namespace scribeline::application {

using domain::ErrorKind;
using domain::ProviderJobState;
using domain::TranscriptionError;

namespace {
constexpr int kHeuristicStepPercent = 5;
}

JobPoller::JobPoller(domain::TranscriptionProvider& provider, domain::Scheduler& scheduler, PollerConfig config)
    : m_provider(provider), m_scheduler(scheduler), m_config(config) {}

int JobPoller::MapProviderProgress(int providerPercent) {
    const int clamped = std::clamp(providerPercent, 0, 100);
    const int band = domain::milestones::kTranscribingCap - domain::milestones::kUploaded;
    return domain::milestones::kUploaded + (clamped * band) / 100;
}

bool JobPoller::start(const std::string& jobId,
                      int startPercent,
                      OnUpdate onUpdate,
                      OnCompleted onCompleted,
                      OnFailed onFailed) {
    if (isFinalized(jobId)) {
        std::cerr << "[JobPoller] Job " << jobId << " already finalized; not polling again" << std::endl;
        return false;
    }
    cancel();
    m_jobId = jobId;
    m_onUpdate = std::move(onUpdate);
    m_onCompleted = std::move(onCompleted);
    m_onFailed = std::move(onFailed);
    m_percent = std::max(startPercent, domain::milestones::kUploaded);
    m_ticks = 0;
    m_startedAt = m_scheduler.now();
    m_active = true;
    std::cout << "[JobPoller] Polling job " << jobId << " every " << m_config.interval.count() << "s" << std::endl;
    scheduleNext();
    return true;
}

void JobPoller::cancel() {
    ++m_generation;
    m_active = false;
    if (m_timer) {
        m_scheduler.cancel(*m_timer);
        m_timer.reset();
    }
}

bool JobPoller::isFinalized(const std::string& jobId) const {
    return m_finalized.count(jobId) > 0;
}

void JobPoller::scheduleNext() {
    const std::uint64_t generation = m_generation;
    m_timer = m_scheduler.schedule(m_config.interval, [this, generation]() {
        if (generation != m_generation) return;
        m_timer.reset();
        tick();
    });
}

void JobPoller::tick() {
    if (!m_active) {
        return;
    }
    if (m_timer) {
        m_scheduler.cancel(*m_timer);
        m_timer.reset();
    }
    ++m_ticks;
    const std::string jobId = m_jobId;
    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(m_scheduler.now() - m_startedAt);

    if (elapsed >= m_config.ceiling) {
        finish(jobId, std::nullopt, TranscriptionError(ErrorKind::PollExhausted,
            "Job " + jobId + " did not finish within " + std::to_string(m_config.ceiling.count()) +
            "s (" + std::to_string(m_ticks) + " polls)"));
        return;
    }

    domain::JobStatusReport report;
    try {
        report = m_provider.getJobStatus(jobId);
    } catch (const TranscriptionError& e) {
        if (e.retryable()) {
            std::cerr << "[JobPoller] Status check failed for " << jobId << ": " << e.describe()
                      << "; will poll again" << std::endl;
            if (m_active) scheduleNext();
            return;
        }
        finish(jobId, std::nullopt, e);
        return;
    }

    switch (report.state) {
        case ProviderJobState::Completed:
            if (!report.result) {
                finish(jobId, std::nullopt, TranscriptionError(ErrorKind::JobFailed,
                    "Provider reported job " + jobId + " completed without a transcript"));
            } else {
                finish(jobId, report.result, std::nullopt);
            }
            return;
        case ProviderJobState::Error:
            finish(jobId, std::nullopt, TranscriptionError(ErrorKind::JobFailed,
                report.error.empty() ? "Transcription failed" : report.error));
            return;
        case ProviderJobState::Queued:
        case ProviderJobState::Processing:
            break;
    }

    PollUpdate update;
    update.jobId = jobId;
    update.state = report.state;
    update.tick = m_ticks;
    if (report.progressPercent && *report.progressPercent > 0) {
        m_percent = std::max(m_percent, MapProviderProgress(*report.progressPercent));
        update.etaSeconds = EtaEstimator::FromProviderProgress(*report.progressPercent, elapsed);
    } else {
        m_percent = std::min(domain::milestones::kTranscribingCap, m_percent + kHeuristicStepPercent);
        update.etaSeconds = EtaEstimator::Heuristic(m_percent);
    }
    update.progressPercent = m_percent;

    const std::uint64_t generation = m_generation;
    if (m_onUpdate) {
        m_onUpdate(update);
    }
    if (m_active && generation == m_generation) {
        scheduleNext();
    }
}

void JobPoller::finish(const std::string& jobId,
                       const std::optional<domain::TranscriptResult>& result,
                       const std::optional<domain::TranscriptionError>& error) {
    if (!m_finalized.insert(jobId).second) {
        std::cout << "[JobPoller] Ignoring repeated terminal status for " << jobId << std::endl;
        return;
    }
    m_finalizedOrder.push_back(jobId);
    if (m_finalizedOrder.size() > kMaxRememberedJobs) {
        m_finalized.erase(m_finalizedOrder.front());
        m_finalizedOrder.pop_front();
    }
    if (m_timer) {
        m_scheduler.cancel(*m_timer);
        m_timer.reset();
    }

    const std::uint64_t generation = m_generation;
    if (result) {
        std::cout << "[JobPoller] Job " << jobId << " completed after " << m_ticks << " polls" << std::endl;
        if (m_onCompleted) m_onCompleted(jobId, *result);
    } else if (error) {
        std::cerr << "[JobPoller] Job " << jobId << " ended: " << error->describe() << std::endl;
        if (m_onFailed) m_onFailed(jobId, *error);
    }
    if (generation == m_generation) {
        m_active = false;
    }
}

} // namespace scribeline::application

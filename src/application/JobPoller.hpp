/**
 * @file JobPoller.hpp
 * @brief Polls a provider job until it reaches a terminal state.
 */

#pragma once

#include "application/PipelineConfig.hpp"
#include "domain/Scheduler.hpp"
#include "domain/TranscriptionError.hpp"
#include "domain/TranscriptionProvider.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <set>
#include <string>

namespace scribeline::application {

/**
 * @struct PollUpdate
 * @brief Non-terminal observation of a job.
 */
struct PollUpdate {
    std::string jobId;
    domain::ProviderJobState state = domain::ProviderJobState::Queued;
    int progressPercent = 0;  ///< Job-level percent, inside the transcribing band.
    long long etaSeconds = 0;
    int tick = 0;
};

/**
 * @class JobPoller
 * @brief Fixed-interval poller with a hard time ceiling and exactly-once terminal handling.
 *
 * The next tick is scheduled only after the current one finished, so ticks never overlap.
 * A job id enters the finalized set before its terminal handler runs; any later observation
 * of the same job (re-entrant tick, restarted poller) is ignored. Only the most recent
 * kMaxRememberedJobs finalized ids are kept.
 */
class JobPoller {
public:
    using OnUpdate = std::function<void(const PollUpdate&)>;
    using OnCompleted = std::function<void(const std::string& jobId, const domain::TranscriptResult&)>;
    using OnFailed = std::function<void(const std::string& jobId, const domain::TranscriptionError&)>;

    JobPoller(domain::TranscriptionProvider& provider, domain::Scheduler& scheduler, PollerConfig config);

    /**
     * @brief Starts polling a job. The first tick runs one interval from now.
     * @param startPercent Job percent when polling begins (30 for a fresh job, the stored value on resume).
     * @return False if the job was already finalized in this process.
     */
    bool start(const std::string& jobId,
               int startPercent,
               OnUpdate onUpdate,
               OnCompleted onCompleted,
               OnFailed onFailed);

    /** @brief Performs one poll immediately. No-op when inactive. */
    void tick();

    /** @brief Stops polling and drops the scheduled tick. */
    void cancel();

    bool isActive() const { return m_active; }
    bool isFinalized(const std::string& jobId) const;
    int ticks() const { return m_ticks; }

    /** @brief Maps provider-side progress into the 30..90 transcribing band. */
    static int MapProviderProgress(int providerPercent);

    static constexpr std::size_t kMaxRememberedJobs = 256;

private:
    void scheduleNext();
    void finish(const std::string& jobId, const std::optional<domain::TranscriptResult>& result,
                const std::optional<domain::TranscriptionError>& error);

    domain::TranscriptionProvider& m_provider;
    domain::Scheduler& m_scheduler;
    PollerConfig m_config;

    std::string m_jobId;
    OnUpdate m_onUpdate;
    OnCompleted m_onCompleted;
    OnFailed m_onFailed;
    bool m_active = false;
    int m_ticks = 0;
    int m_percent = 0;
    domain::Scheduler::Clock::time_point m_startedAt{};
    std::optional<domain::Scheduler::TaskId> m_timer;
    std::uint64_t m_generation = 0;
    std::set<std::string> m_finalized;
    std::deque<std::string> m_finalizedOrder;  // oldest first, for eviction
};

} // namespace scribeline::application

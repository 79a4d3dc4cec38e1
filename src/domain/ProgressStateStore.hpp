/**
 * @file ProgressStateStore.hpp
 * @brief Persistence port for the single active job slot.
 */

#pragma once

#include "domain/TranscriptionJob.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace scribeline::domain {

/**
 * @struct PersistedJobState
 * @brief The one record kept across process restarts.
 */
struct PersistedJobState {
    std::string jobId; ///< Empty while the upload has not been accepted yet.
    JobStatus status = JobStatus::Idle;
    int progressPercent = 0;
    long long etaSeconds = 0;
    std::chrono::system_clock::time_point updatedAt{};
    std::string fileName;
    Provider provider = Provider::Primary;

    /** @brief Absent and terminal records both mean "nothing to resume". */
    bool isResumable() const { return !IsTerminal(status) && status != JobStatus::Idle; }
};

inline PersistedJobState SnapshotOf(const TranscriptionJob& job) {
    PersistedJobState state;
    state.jobId = job.id.value_or("");
    state.status = job.status;
    state.progressPercent = job.progressPercent;
    state.etaSeconds = job.etaSeconds;
    state.updatedAt = std::chrono::system_clock::now();
    state.fileName = job.sourceFile.name;
    state.provider = job.provider;
    return state;
}

/**
 * @class ProgressStateStore
 * @brief Key-value slot holding the current active job. Implementations may be in-memory,
 * file-backed or database-backed.
 */
class ProgressStateStore {
public:
    virtual ~ProgressStateStore() = default;

    virtual std::optional<PersistedJobState> get() const = 0;
    virtual void set(const PersistedJobState& state) = 0;
    virtual void clear() = 0;
};

} // namespace scribeline::domain

/**
 * @file JobStateMachine.hpp
 * @brief Pure transition function for a single TranscriptionJob.
 *
 * Each transition maps (current job, event) to (next job, side effects). The pipeline
 * executes the effects; nothing in here performs I/O.
 */

#pragma once

#include "domain/TranscriptionError.hpp"
#include "domain/TranscriptionJob.hpp"

#include <chrono>
#include <string>
#include <variant>
#include <vector>

namespace scribeline::domain {

namespace events {

struct Submitted {
    bool chunked = false;
    long long initialEtaSeconds = 0;
    std::chrono::system_clock::time_point at{};
};

struct UploadStarted {
    Provider provider = Provider::Primary;
};

struct ChunkUploaded {
    std::size_t index = 0;
    std::size_t total = 1;
};

struct ChunksUploaded {};

struct JobCreated {
    std::string jobId;
};

struct ProgressReported {
    int percent = 0;
    long long etaSeconds = 0;
};

struct Completed {
    std::chrono::system_clock::time_point at{};
};

struct Failed {
    TranscriptionError error;
    std::chrono::system_clock::time_point at{};
};

struct Resumed {
    std::string jobId;
    int percent = 0;
    long long etaSeconds = 0;
    Provider provider = Provider::Primary;
};

} // namespace events

using JobEvent = std::variant<events::Submitted,
                              events::UploadStarted,
                              events::ChunkUploaded,
                              events::ChunksUploaded,
                              events::JobCreated,
                              events::ProgressReported,
                              events::Completed,
                              events::Failed,
                              events::Resumed>;

/**
 * @enum Effect
 * @brief Side effects requested by a transition, executed in the listed order.
 */
enum class Effect {
    Persist,       ///< Write the job snapshot to the progress state store.
    Notify,        ///< Tell observers about the new status/progress.
    StartPolling,  ///< Begin polling the provider job.
    Finalize,      ///< Run terminal handling (deliver result or error).
    Clear          ///< Clear the progress state store.
};

struct Transition {
    TranscriptionJob job;
    std::vector<Effect> effects;
    bool accepted = false; ///< False when the event does not apply to the current state.
};

/// Progress milestones of one lifecycle.
namespace milestones {
constexpr int kPreparing = 5;
constexpr int kUploading = 10;
constexpr int kUploaded = 30;
constexpr int kTranscribingCap = 90;
constexpr int kCombining = 95;
constexpr int kCompleted = 100;
} // namespace milestones

class JobStateMachine {
public:
    static Transition apply(const TranscriptionJob& job, const JobEvent& event);

    /** @brief Name of the event type, for logs. */
    static const char* eventName(const JobEvent& event);
};

} // namespace scribeline::domain

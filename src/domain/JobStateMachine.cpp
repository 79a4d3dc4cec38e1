/**
 * @file JobStateMachine.cpp
 * @brief Implementation of JobStateMachine.
 */

#include "domain/JobStateMachine.hpp"

#include <algorithm>

namespace scribeline::domain {

namespace {

Transition Reject(const TranscriptionJob& job) {
    return Transition{job, {}, false};
}

Transition Accept(TranscriptionJob next, std::vector<Effect> effects) {
    return Transition{std::move(next), std::move(effects), true};
}

// Progress only moves forward inside one lifecycle.
void Advance(TranscriptionJob& job, int percent) {
    job.progressPercent = std::max(job.progressPercent, std::min(percent, milestones::kCompleted));
}

} // namespace

Transition JobStateMachine::apply(const TranscriptionJob& job, const JobEvent& event) {
    if (IsTerminal(job.status)) {
        return Reject(job);
    }

    TranscriptionJob next = job;

    if (const auto* e = std::get_if<events::Submitted>(&event)) {
        if (job.status != JobStatus::Idle) return Reject(job);
        next.status = e->chunked ? JobStatus::PreparingChunks : JobStatus::Preparing;
        next.createdAt = e->at;
        next.etaSeconds = e->initialEtaSeconds;
        Advance(next, milestones::kPreparing);
        return Accept(next, {Effect::Persist, Effect::Notify});
    }

    if (const auto* e = std::get_if<events::UploadStarted>(&event)) {
        if (job.status == JobStatus::Preparing) {
            next.status = JobStatus::Uploading;
        } else if (job.status == JobStatus::PreparingChunks && e->provider == Provider::Fallback) {
            // The fallback route takes the whole file in one synchronous request.
            next.status = JobStatus::Uploading;
            next.chunks.clear();
        } else if (job.status == JobStatus::PreparingChunks) {
            next.status = JobStatus::ProcessingChunks;
        } else {
            return Reject(job);
        }
        next.provider = e->provider;
        Advance(next, milestones::kUploading);
        return Accept(next, {Effect::Persist, Effect::Notify});
    }

    if (const auto* e = std::get_if<events::ChunkUploaded>(&event)) {
        if (job.status != JobStatus::ProcessingChunks || e->total == 0) return Reject(job);
        const int span = milestones::kTranscribingCap - milestones::kUploading;
        const int percent = milestones::kUploading +
            static_cast<int>((static_cast<long long>(span) * static_cast<long long>(e->index + 1)) /
                             static_cast<long long>(e->total));
        Advance(next, percent);
        return Accept(next, {Effect::Persist, Effect::Notify});
    }

    if (std::holds_alternative<events::ChunksUploaded>(event)) {
        if (job.status != JobStatus::ProcessingChunks) return Reject(job);
        next.status = JobStatus::CombiningResults;
        next.etaSeconds = 0;
        Advance(next, milestones::kCombining);
        return Accept(next, {Effect::Persist, Effect::Notify});
    }

    if (const auto* e = std::get_if<events::JobCreated>(&event)) {
        if (job.status != JobStatus::Uploading || e->jobId.empty()) return Reject(job);
        next.id = e->jobId;
        next.status = JobStatus::Transcribing;
        Advance(next, milestones::kUploaded);
        return Accept(next, {Effect::Persist, Effect::Notify, Effect::StartPolling});
    }

    if (const auto* e = std::get_if<events::ProgressReported>(&event)) {
        if (job.status != JobStatus::Transcribing) return Reject(job);
        // 100 is reserved for the completed state.
        Advance(next, std::min(e->percent, milestones::kCompleted - 1));
        next.etaSeconds = std::max(0LL, e->etaSeconds);
        return Accept(next, {Effect::Persist, Effect::Notify});
    }

    if (const auto* e = std::get_if<events::Completed>(&event)) {
        if (job.status != JobStatus::Transcribing &&
            job.status != JobStatus::CombiningResults &&
            job.status != JobStatus::Uploading) {
            return Reject(job);
        }
        next.status = JobStatus::Completed;
        next.progressPercent = milestones::kCompleted;
        next.etaSeconds = 0;
        next.completedAt = e->at;
        return Accept(next, {Effect::Finalize, Effect::Clear, Effect::Notify});
    }

    if (const auto* e = std::get_if<events::Failed>(&event)) {
        next.status = JobStatus::Failed;
        next.etaSeconds = 0;
        next.completedAt = e->at;
        return Accept(next, {Effect::Finalize, Effect::Clear, Effect::Notify});
    }

    if (const auto* e = std::get_if<events::Resumed>(&event)) {
        if (job.status != JobStatus::Idle || e->jobId.empty()) return Reject(job);
        next.id = e->jobId;
        next.status = JobStatus::Transcribing;
        next.provider = e->provider;
        next.etaSeconds = e->etaSeconds;
        Advance(next, e->percent);
        return Accept(next, {Effect::Persist, Effect::Notify, Effect::StartPolling});
    }

    return Reject(job);
}

const char* JobStateMachine::eventName(const JobEvent& event) {
    switch (event.index()) {
        case 0: return "Submitted";
        case 1: return "UploadStarted";
        case 2: return "ChunkUploaded";
        case 3: return "ChunksUploaded";
        case 4: return "JobCreated";
        case 5: return "ProgressReported";
        case 6: return "Completed";
        case 7: return "Failed";
        case 8: return "Resumed";
    }
    return "Unknown";
}

} // namespace scribeline::domain

#include <algorithm>
#include <cassert>
#include <iostream>

#include "domain/JobStateMachine.hpp"

using namespace scribeline::domain;

namespace {

bool HasEffect(const Transition& t, Effect effect) {
    return std::find(t.effects.begin(), t.effects.end(), effect) != t.effects.end();
}

TranscriptionJob Step(const TranscriptionJob& job, const JobEvent& event) {
    Transition t = JobStateMachine::apply(job, event);
    assert(t.accepted);
    return t.job;
}

void TestSingleShotLifecycle() {
    TranscriptionJob job;
    job.sourceFile = SourceFile{"memo.m4a", 1000, "audio/m4a"};

    Transition submitted = JobStateMachine::apply(job, events::Submitted{false, 120, {}});
    assert(submitted.accepted);
    assert(submitted.job.status == JobStatus::Preparing);
    assert(submitted.job.progressPercent == milestones::kPreparing);
    assert(submitted.job.etaSeconds == 120);
    assert(HasEffect(submitted, Effect::Persist));

    job = Step(submitted.job, events::UploadStarted{Provider::Primary});
    assert(job.status == JobStatus::Uploading);
    assert(job.progressPercent == milestones::kUploading);

    Transition created = JobStateMachine::apply(job, events::JobCreated{"job-1"});
    assert(created.accepted);
    assert(created.job.id && *created.job.id == "job-1");
    assert(created.job.status == JobStatus::Transcribing);
    assert(created.job.progressPercent == milestones::kUploaded);
    assert(HasEffect(created, Effect::StartPolling));

    job = Step(created.job, events::ProgressReported{60, 40});
    assert(job.progressPercent == 60);
    assert(job.etaSeconds == 40);

    Transition done = JobStateMachine::apply(job, events::Completed{});
    assert(done.accepted);
    assert(done.job.status == JobStatus::Completed);
    assert(done.job.progressPercent == 100);
    assert(done.job.completedAt.has_value());
    assert(done.effects.size() == 3);
    assert(done.effects[0] == Effect::Finalize);
    assert(done.effects[1] == Effect::Clear);
    std::cout << "[PASS] Single-shot lifecycle walks preparing -> completed." << std::endl;
}

void TestProgressNeverDecreases() {
    TranscriptionJob job;
    job = Step(job, events::Submitted{false, 0, {}});
    job = Step(job, events::UploadStarted{Provider::Primary});
    job = Step(job, events::JobCreated{"job-2"});
    job = Step(job, events::ProgressReported{70, 10});
    job = Step(job, events::ProgressReported{40, 5});
    assert(job.progressPercent == 70);
    job = Step(job, events::ProgressReported{100, 0});
    assert(job.progressPercent == 99);
    assert(job.status == JobStatus::Transcribing);
    std::cout << "[PASS] Reported progress is monotonic and below 100 until completion." << std::endl;
}

void TestChunkedLifecycle() {
    TranscriptionJob job;
    job = Step(job, events::Submitted{true, 0, {}});
    assert(job.status == JobStatus::PreparingChunks);
    job = Step(job, events::UploadStarted{Provider::Primary});
    assert(job.status == JobStatus::ProcessingChunks);

    job = Step(job, events::ChunkUploaded{0, 4});
    assert(job.progressPercent == 30);
    job = Step(job, events::ChunkUploaded{1, 4});
    assert(job.progressPercent == 50);
    job = Step(job, events::ChunkUploaded{3, 4});
    assert(job.progressPercent == 90);

    assert(!JobStateMachine::apply(job, events::JobCreated{"x"}).accepted);

    job = Step(job, events::ChunksUploaded{});
    assert(job.status == JobStatus::CombiningResults);
    assert(job.progressPercent == milestones::kCombining);
    job = Step(job, events::Completed{});
    assert(job.status == JobStatus::Completed);

    TranscriptionJob rerouted;
    rerouted.chunks.resize(3);
    rerouted = Step(rerouted, events::Submitted{true, 0, {}});
    rerouted = Step(rerouted, events::UploadStarted{Provider::Fallback});
    assert(rerouted.status == JobStatus::Uploading);
    assert(rerouted.provider == Provider::Fallback);
    assert(!rerouted.isChunked());
    rerouted = Step(rerouted, events::Completed{});
    assert(rerouted.status == JobStatus::Completed);
    std::cout << "[PASS] Chunked lifecycle advances proportionally and combines." << std::endl;
}

void TestTerminalStatesAbsorb() {
    TranscriptionJob job;
    job = Step(job, events::Submitted{false, 0, {}});
    job = Step(job, events::UploadStarted{Provider::Primary});
    job = Step(job, events::Failed{TranscriptionError(ErrorKind::AuthOrBilling, "denied"), {}});
    assert(job.status == JobStatus::Failed);
    assert(job.progressPercent == milestones::kUploading);

    const JobEvent later[] = {
        events::Submitted{false, 0, {}},
        events::JobCreated{"job-3"},
        events::ProgressReported{80, 1},
        events::Completed{},
        events::Failed{TranscriptionError(ErrorKind::NetworkTransient, "again"), {}},
        events::Resumed{"job-3", 50, 10, Provider::Primary}
    };
    for (const JobEvent& event : later) {
        Transition t = JobStateMachine::apply(job, event);
        assert(!t.accepted);
        assert(t.effects.empty());
        assert(t.job.status == JobStatus::Failed);
    }
    std::cout << "[PASS] Completed and failed absorb every later event." << std::endl;
}

void TestOutOfOrderEventsRejected() {
    TranscriptionJob idle;
    assert(!JobStateMachine::apply(idle, events::UploadStarted{Provider::Primary}).accepted);
    assert(!JobStateMachine::apply(idle, events::Completed{}).accepted);
    assert(!JobStateMachine::apply(idle, events::ChunkUploaded{0, 1}).accepted);

    TranscriptionJob uploading = Step(Step(idle, events::Submitted{false, 0, {}}), events::UploadStarted{Provider::Primary});
    assert(!JobStateMachine::apply(uploading, events::JobCreated{""}).accepted);
    assert(!JobStateMachine::apply(uploading, events::Submitted{false, 0, {}}).accepted);

    // Validation failures happen before anything was submitted.
    Transition early = JobStateMachine::apply(idle, events::Failed{TranscriptionError(ErrorKind::Validation, "empty"), {}});
    assert(early.accepted);
    assert(early.job.status == JobStatus::Failed);
    std::cout << "[PASS] Events that do not fit the current state are rejected." << std::endl;
}

void TestResume() {
    TranscriptionJob idle;
    Transition resumed = JobStateMachine::apply(idle, events::Resumed{"job-9", 55, 90, Provider::Primary});
    assert(resumed.accepted);
    assert(resumed.job.status == JobStatus::Transcribing);
    assert(resumed.job.progressPercent == 55);
    assert(resumed.job.id && *resumed.job.id == "job-9");
    assert(HasEffect(resumed, Effect::StartPolling));
    assert(!JobStateMachine::apply(idle, events::Resumed{"", 55, 90, Provider::Primary}).accepted);
    assert(std::string(JobStateMachine::eventName(events::Resumed{})) == "Resumed");
    std::cout << "[PASS] Resume rebuilds a transcribing job at the stored progress." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting JobStateMachine Test..." << std::endl;
    TestSingleShotLifecycle();
    TestProgressNeverDecreases();
    TestChunkedLifecycle();
    TestTerminalStatesAbsorb();
    TestOutOfOrderEventsRejected();
    TestResume();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}

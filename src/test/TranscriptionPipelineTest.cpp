#include <cassert>
#include <iostream>
#include <memory>
#include <optional>

#include "application/TranscriptionPipeline.hpp"
#include "infrastructure/InMemoryProgressStateStore.hpp"
#include "test/TestDoubles.hpp"

using namespace scribeline;
using namespace scribeline::application;
using domain::ErrorKind;
using domain::JobStatus;
using domain::ProviderJobState;
using domain::TranscriptionError;
using test::kMiB;

namespace {

struct Harness {
    explicit Harness(PipelineConfig cfg = PipelineConfig{}) : config(cfg) {
        pipeline = std::make_unique<TranscriptionPipeline>(config, broker, provider, store, scheduler);
        pipeline->setProgressObserver([this](const domain::TranscriptionJob& job) { observed.push_back(job); });
    }

    std::optional<JobOutcome> submitAndRun(std::shared_ptr<const domain::MediaSource> source) {
        std::optional<JobOutcome> outcome;
        const bool accepted = pipeline->submit(std::move(source), [&outcome](const JobOutcome& o) { outcome = o; });
        assert(accepted);
        scheduler.runAll();
        return outcome;
    }

    bool progressIsMonotonic() const {
        for (std::size_t i = 1; i < observed.size(); ++i) {
            if (observed[i].progressPercent < observed[i - 1].progressPercent) return false;
        }
        return true;
    }

    test::ManualScheduler scheduler;
    test::ScriptedBroker broker;
    test::ScriptedProvider provider;
    infrastructure::InMemoryProgressStateStore store;
    PipelineConfig config;
    std::unique_ptr<TranscriptionPipeline> pipeline;
    std::vector<domain::TranscriptionJob> observed;
};

void TestSingleShotUploadAndPoll() {
    Harness h;
    int checks = 0;
    std::optional<std::string> persistedJobId;
    h.provider.onStatus = [&](const std::string& id) {
        persistedJobId = h.store.get() ? std::optional<std::string>(h.store.get()->jobId) : std::nullopt;
        if (++checks < 3) return test::StatusReport(ProviderJobState::Processing, 50);
        return test::CompletedReport("Speaker A: hello.", 12.5);
    };

    auto outcome = h.submitAndRun(std::make_shared<test::MemoryMediaSource>("memo.m4a", 1 * kMiB));
    assert(outcome && outcome->succeeded());
    assert(outcome->result->text == "Speaker A: hello.");
    assert(outcome->result->durationSeconds == 12.5);
    assert(outcome->job.id && *outcome->job.id == "job-1");
    assert(outcome->job.status == JobStatus::Completed);
    assert(outcome->job.progressPercent == 100);

    assert(h.provider.uploads.size() == 1);
    assert(h.provider.createdJobs.size() == 1);
    assert(h.provider.createdJobs[0] == "mem://https://upload.test/memo.m4a");
    assert(h.provider.lastSpeakerLabels);
    assert(h.broker.requests.size() == 1);
    assert(persistedJobId && *persistedJobId == "job-1");

    assert(!h.store.get());
    assert(h.store.writes() > 0);
    assert(h.store.clears() == 1);
    assert(h.progressIsMonotonic());
    assert(h.observed.back().status == JobStatus::Completed);
    assert(!h.pipeline->isBusy());
    assert(h.pipeline->finalizedCount() == 1);
    assert(h.scheduler.pending() == 0);
    std::cout << "[PASS] Small file uploads once, polls and completes." << std::endl;
}

void TestChunkedUploadWithRetriesCombines() {
    PipelineConfig config;
    config.chunking.directUploadThresholdBytes = 4 * kMiB;
    config.chunking.chunkSizeBytes = 4 * kMiB;
    Harness h(config);

    int secondChunkAttempts = 0;
    h.provider.onUpload = [&](const domain::UploadCredential&, const std::string& payload) {
        if (payload.size() == 4 * kMiB) {
            return test::TranscriptReceipt("Chunk one text. ", 240.5);
        }
        assert(payload.size() == 1 * kMiB);
        if (++secondChunkAttempts < 3) {
            throw TranscriptionError(ErrorKind::NetworkTransient, "connection reset by peer");
        }
        return test::TranscriptReceipt("Chunk two text.", 60.25);
    };

    auto outcome = h.submitAndRun(std::make_shared<test::MemoryMediaSource>("interview.m4a", 5 * kMiB));
    assert(outcome && outcome->succeeded());
    assert(outcome->result->text == "Chunk one text. Chunk two text.");
    assert(outcome->result->durationSeconds == 240.5 + 60.25);
    assert(outcome->job.chunks.size() == 2);
    assert(!outcome->job.id);

    assert(secondChunkAttempts == 3);
    assert(h.provider.uploads.size() == 4);
    assert(h.provider.createdJobs.empty());
    assert(h.provider.statusChecks.empty());

    // Whole-file request decides the route, then one credential per chunk.
    assert(h.broker.requests.size() == 3);
    assert(h.broker.requests[1].name == "interview.part001of002.m4a");
    assert(h.broker.requests[2].name == "interview.part002of002.m4a");
    assert(h.broker.requests[2].byteSize == 1 * kMiB);
    // Retries of the second chunk reuse its credential.
    assert(h.provider.uploads[1].authToken == h.provider.uploads[3].authToken);

    bool sawCombining = false;
    for (const auto& job : h.observed) {
        if (job.status == JobStatus::CombiningResults) sawCombining = true;
    }
    assert(sawCombining);
    assert(h.progressIsMonotonic());
    assert(!h.store.get());
    std::cout << "[PASS] 5 MB file: second chunk recovers on attempt 3 and transcripts combine in order." << std::endl;
}

void TestFallbackWithinLimit() {
    Harness h;
    h.broker.onRequest = [](const domain::SourceFile&) -> domain::CredentialResponse {
        return test::MakeFallbackDirective(25 * 1000 * 1000);
    };
    auto outcome = h.submitAndRun(std::make_shared<test::MemoryMediaSource>("meeting.mp3", 20 * 1000 * 1000, "audio/mpeg"));
    assert(outcome && outcome->succeeded());
    assert(outcome->result->text == "fallback transcript of meeting.mp3");
    assert(outcome->job.provider == domain::Provider::Fallback);
    assert(h.provider.uploads.empty());
    assert(h.provider.createdJobs.empty());
    assert(h.provider.fallbackCalls.size() == 1);
    std::cout << "[PASS] 20 MB file completes through the fallback without touching the primary upload." << std::endl;
}

void TestFallbackOverLimit() {
    Harness h;
    h.broker.onRequest = [](const domain::SourceFile&) -> domain::CredentialResponse {
        return test::MakeFallbackDirective(25 * kMiB);
    };
    auto source = std::make_shared<test::MemoryMediaSource>("meeting.mp3", 30 * kMiB, "audio/mpeg");
    auto outcome = h.submitAndRun(source);
    assert(outcome && !outcome->succeeded());
    assert(outcome->error->kind() == ErrorKind::PayloadTooLarge);
    const std::string message = outcome->error->what();
    assert(message.find("25.0 MB") != std::string::npos);
    assert(message.find("4.0 MB") != std::string::npos);
    assert(h.provider.uploads.empty());
    assert(h.provider.fallbackCalls.empty());
    assert(source->reads() == 0);
    assert(!h.store.get());
    std::cout << "[PASS] 30 MB file fails with PayloadTooLarge and uploads nothing." << std::endl;
}

void TestLocalRejections() {
    {
        Harness h;
        auto outcome = h.submitAndRun(std::make_shared<test::MemoryMediaSource>("notes.txt", 100, "text/plain"));
        assert(outcome && outcome->error->kind() == ErrorKind::UnsupportedFormat);
        assert(h.broker.requests.empty());
    }
    {
        Harness h;
        auto outcome = h.submitAndRun(std::make_shared<test::MemoryMediaSource>("empty.m4a", 0));
        assert(outcome && outcome->error->kind() == ErrorKind::Validation);
        assert(h.broker.requests.empty());
    }
    {
        Harness h;
        auto source = std::make_shared<test::MemoryMediaSource>("locked.m4a", 100);
        source->setReadable(false);
        auto outcome = h.submitAndRun(source);
        assert(outcome && outcome->error->kind() == ErrorKind::Validation);
    }
    {
        PipelineConfig config;
        config.maxFileSizeBytes = 10 * kMiB;
        Harness h(config);
        auto outcome = h.submitAndRun(std::make_shared<test::MemoryMediaSource>("huge.wav", 11 * kMiB, "audio/wav"));
        assert(outcome && outcome->error->kind() == ErrorKind::PayloadTooLarge);
        assert(h.broker.requests.empty());
    }
    std::cout << "[PASS] Unsupported, empty, unreadable and oversized files fail before any network call." << std::endl;
}

void TestAuthFailureIsNotRetried() {
    Harness h;
    h.provider.onUpload = [](const domain::UploadCredential&, const std::string&) -> domain::UploadReceipt {
        throw TranscriptionError(ErrorKind::AuthOrBilling, "402 payment required");
    };
    auto outcome = h.submitAndRun(std::make_shared<test::MemoryMediaSource>("memo.m4a", 1000));
    assert(outcome && outcome->error->kind() == ErrorKind::AuthOrBilling);
    assert(!outcome->error->remediation().empty());
    assert(h.provider.uploads.size() == 1);
    assert(outcome->job.status == JobStatus::Failed);
    assert(outcome->job.progressPercent == 10);
    std::cout << "[PASS] Auth/billing rejection fails after a single attempt." << std::endl;
}

void TestOneJobAtATime() {
    Harness h;
    std::optional<JobOutcome> first;
    assert(h.pipeline->submit(std::make_shared<test::MemoryMediaSource>("a.m4a", 100),
                              [&](const JobOutcome& o) { first = o; }));
    assert(h.pipeline->isBusy());
    assert(!h.pipeline->submit(std::make_shared<test::MemoryMediaSource>("b.m4a", 100), [](const JobOutcome&) {}));
    h.scheduler.runAll();
    assert(first && first->succeeded());
    assert(!h.pipeline->isBusy());

    auto second = h.submitAndRun(std::make_shared<test::MemoryMediaSource>("b.m4a", 100));
    assert(second && second->succeeded());
    assert(h.provider.uploads.size() == 2);
    std::cout << "[PASS] A second submission is refused while a job is active." << std::endl;
}

void TestCancelWhilePolling() {
    Harness h;
    h.provider.onStatus = [](const std::string&) { return test::StatusReport(ProviderJobState::Processing, 10); };

    std::optional<JobOutcome> outcome;
    h.pipeline->submit(std::make_shared<test::MemoryMediaSource>("memo.m4a", 1000),
                       [&](const JobOutcome& o) { outcome = o; });
    h.scheduler.advance(std::chrono::seconds(12));
    assert(h.pipeline->currentJob().status == JobStatus::Transcribing);
    assert(h.store.get() && h.store.get()->jobId == "job-1");
    assert(h.provider.statusChecks.size() == 2);

    h.pipeline->cancel();
    assert(outcome && outcome->error->kind() == ErrorKind::Cancelled);
    assert(!h.store.get());
    assert(h.scheduler.pending() == 0);
    h.scheduler.advance(std::chrono::seconds(60));
    assert(h.provider.statusChecks.size() == 2);
    assert(h.pipeline->finalizedCount() == 1);
    std::cout << "[PASS] Cancel stops polling and clears persisted state." << std::endl;
}

void TestResumeWithJobId() {
    Harness h;
    domain::PersistedJobState saved;
    saved.jobId = "job-42";
    saved.status = JobStatus::Transcribing;
    saved.progressPercent = 55;
    saved.etaSeconds = 100;
    saved.fileName = "old.m4a";
    h.store.set(saved);

    int checks = 0;
    h.provider.onStatus = [&](const std::string& id) {
        assert(id == "job-42");
        if (++checks < 2) return test::StatusReport(ProviderJobState::Processing);
        return test::CompletedReport("resumed text", 8.0);
    };

    std::optional<JobOutcome> outcome;
    assert(h.pipeline->resume([&](const JobOutcome& o) { outcome = o; }));
    assert(h.pipeline->isBusy());
    assert(h.provider.uploads.empty());
    h.scheduler.runAll();

    assert(outcome && outcome->succeeded());
    assert(outcome->result->text == "resumed text");
    assert(outcome->job.sourceFile.name == "old.m4a");
    assert(h.observed.front().progressPercent == 55);
    assert(h.progressIsMonotonic());
    assert(!h.store.get());
    std::cout << "[PASS] Resume restarts polling for a stored job id." << std::endl;
}

void TestResumeWithoutJobId() {
    Harness h;
    domain::PersistedJobState saved;
    saved.status = JobStatus::Uploading;
    saved.progressPercent = 10;
    saved.fileName = "interrupted.m4a";
    h.store.set(saved);

    std::optional<JobOutcome> outcome;
    assert(h.pipeline->resume([&](const JobOutcome& o) { outcome = o; }));
    assert(outcome && outcome->error->kind() == ErrorKind::NetworkTransient);
    assert(std::string(outcome->error->what()).find("resubmit") != std::string::npos);
    assert(!h.store.get());
    assert(h.provider.statusChecks.empty());
    assert(!h.pipeline->isBusy());
    std::cout << "[PASS] A record without a job id fails and is cleared." << std::endl;
}

void TestResumeNothingToDo() {
    Harness h;
    assert(!h.pipeline->resume([](const JobOutcome&) { assert(false); }));

    domain::PersistedJobState finished;
    finished.jobId = "job-1";
    finished.status = JobStatus::Completed;
    finished.progressPercent = 100;
    h.store.set(finished);
    assert(!h.pipeline->resume([](const JobOutcome&) { assert(false); }));
    assert(!h.store.get());
    std::cout << "[PASS] Absent or terminal records resume nothing." << std::endl;
}

void TestRetryStartsFreshLifecycle() {
    Harness h;
    bool reject = true;
    h.provider.onUpload = [&](const domain::UploadCredential& credential, const std::string&) {
        if (reject) throw TranscriptionError(ErrorKind::InvalidRequest, "400");
        domain::UploadReceipt receipt;
        receipt.uploadedUrl = "mem://" + credential.uploadUrl;
        return receipt;
    };
    auto source = std::make_shared<test::MemoryMediaSource>("memo.m4a", 1000);
    auto failed = h.submitAndRun(source);
    assert(failed && !failed->succeeded());
    const std::size_t before = h.observed.size();

    reject = false;
    auto retried = h.submitAndRun(source);
    assert(retried && retried->succeeded());
    assert(h.observed[before].progressPercent == 5);
    assert(h.observed[before].status == JobStatus::Preparing);
    std::cout << "[PASS] Resubmitting after a failure starts a new lifecycle." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting TranscriptionPipeline Test..." << std::endl;
    TestSingleShotUploadAndPoll();
    TestChunkedUploadWithRetriesCombines();
    TestFallbackWithinLimit();
    TestFallbackOverLimit();
    TestLocalRejections();
    TestAuthFailureIsNotRetried();
    TestOneJobAtATime();
    TestCancelWhilePolling();
    TestResumeWithJobId();
    TestResumeWithoutJobId();
    TestResumeNothingToDo();
    TestRetryStartsFreshLifecycle();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}

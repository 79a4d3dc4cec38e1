#include <cassert>
#include <iostream>
#include <optional>
#include <string>

#include "application/EtaEstimator.hpp"
#include "application/JobPoller.hpp"
#include "test/TestDoubles.hpp"

using namespace scribeline;
using namespace scribeline::application;
using domain::ErrorKind;
using domain::ProviderJobState;
using domain::TranscriptionError;
using std::chrono::seconds;

namespace {

PollerConfig FastConfig() {
    PollerConfig config;
    config.interval = seconds(5);
    config.ceiling = seconds(60);
    return config;
}

void TestPollsUntilCompleted() {
    test::ManualScheduler scheduler;
    test::ScriptedProvider provider;
    JobPoller poller(provider, scheduler, FastConfig());

    int checks = 0;
    provider.onStatus = [&](const std::string& id) {
        ++checks;
        if (checks < 4) return test::StatusReport(ProviderJobState::Processing, checks * 20);
        return test::CompletedReport("hello " + id, 42.0);
    };

    std::vector<PollUpdate> updates;
    std::optional<domain::TranscriptResult> result;
    assert(poller.start("job-1", 30,
        [&](const PollUpdate& u) { updates.push_back(u); },
        [&](const std::string&, const domain::TranscriptResult& r) { result = r; },
        [](const std::string&, const TranscriptionError&) { assert(false); }));

    // Nothing happens before the first interval.
    scheduler.advance(std::chrono::milliseconds(4999));
    assert(checks == 0);
    scheduler.runAll();

    assert(result && result->text == "hello job-1");
    assert(result->durationSeconds == 42.0);
    assert(checks == 4);
    assert(poller.ticks() == 4);
    assert(!poller.isActive());
    assert(poller.isFinalized("job-1"));
    assert(updates.size() == 3);
    // Provider progress 20/40/60 maps into the 30..90 band.
    assert(updates[0].progressPercent == 42);
    assert(updates[1].progressPercent == 54);
    assert(updates[2].progressPercent == 66);
    // 20% after 5 s leaves 20 s.
    assert(updates[0].etaSeconds == 20);
    assert(scheduler.pending() == 0);
    std::cout << "[PASS] Poller ticks every interval and completes once." << std::endl;
}

void TestTerminalHandledExactlyOnce() {
    test::ManualScheduler scheduler;
    test::ScriptedProvider provider;
    JobPoller poller(provider, scheduler, FastConfig());
    provider.onStatus = [](const std::string&) { return test::CompletedReport("done", 1.0); };

    int completions = 0;
    poller.start("job-7", 30,
        [](const PollUpdate&) {},
        [&](const std::string&, const domain::TranscriptResult&) {
            ++completions;
            // A second tick lands while the first terminal handler is still running.
            poller.tick();
            poller.tick();
        },
        [](const std::string&, const TranscriptionError&) { assert(false); });

    scheduler.runAll();
    assert(completions == 1);
    assert(provider.statusChecks.size() == 3);

    // Restarting against a finalized id is refused.
    assert(!poller.start("job-7", 30, nullptr,
        [&](const std::string&, const domain::TranscriptResult&) { ++completions; }, nullptr));
    scheduler.runAll();
    poller.tick();
    assert(completions == 1);
    std::cout << "[PASS] Repeated terminal observations finalize a job exactly once." << std::endl;
}

void TestCeilingStopsPolling() {
    test::ManualScheduler scheduler;
    test::ScriptedProvider provider;
    JobPoller poller(provider, scheduler, FastConfig());
    provider.onStatus = [](const std::string&) { return test::StatusReport(ProviderJobState::Queued); };

    std::optional<TranscriptionError> failure;
    std::vector<int> percents;
    poller.start("job-slow", 30,
        [&](const PollUpdate& u) { percents.push_back(u.progressPercent); },
        [](const std::string&, const domain::TranscriptResult&) { assert(false); },
        [&](const std::string&, const TranscriptionError& e) { failure = e; });
    scheduler.runAll();

    assert(failure && failure->kind() == ErrorKind::PollExhausted);
    // 60 s ceiling with a 5 s interval: the 12th tick hits the ceiling without a status call.
    assert(poller.ticks() == 12);
    assert(provider.statusChecks.size() == 11);
    for (std::size_t i = 1; i < percents.size(); ++i) {
        assert(percents[i] >= percents[i - 1]);
    }
    assert(percents.back() <= 90);
    std::cout << "[PASS] Poll ceiling ends the job with PollExhausted." << std::endl;
}

void TestHeuristicProgressWithoutProviderPercent() {
    test::ManualScheduler scheduler;
    test::ScriptedProvider provider;
    JobPoller poller(provider, scheduler, FastConfig());
    int checks = 0;
    provider.onStatus = [&](const std::string&) {
        if (++checks == 3) return test::CompletedReport("t", 1.0);
        return test::StatusReport(ProviderJobState::Processing);
    };
    std::vector<PollUpdate> updates;
    poller.start("job-h", 30,
        [&](const PollUpdate& u) { updates.push_back(u); },
        [](const std::string&, const domain::TranscriptResult&) {},
        [](const std::string&, const TranscriptionError&) { assert(false); });
    scheduler.runAll();
    assert(updates.size() == 2);
    assert(updates[0].progressPercent == 35);
    assert(updates[0].etaSeconds == EtaEstimator::Heuristic(35));
    assert(updates[1].progressPercent == 40);
    std::cout << "[PASS] Without provider progress the heuristic creeps up 5% per tick." << std::endl;
}

void TestTransientStatusErrorsKeepPolling() {
    test::ManualScheduler scheduler;
    test::ScriptedProvider provider;
    JobPoller poller(provider, scheduler, FastConfig());
    int checks = 0;
    provider.onStatus = [&](const std::string&) -> domain::JobStatusReport {
        ++checks;
        if (checks <= 2) throw TranscriptionError(ErrorKind::NetworkTransient, "503");
        return test::CompletedReport("back", 2.0);
    };
    bool completed = false;
    poller.start("job-t", 30, nullptr,
        [&](const std::string&, const domain::TranscriptResult&) { completed = true; },
        [](const std::string&, const TranscriptionError&) { assert(false); });
    scheduler.runAll();
    assert(completed);
    assert(checks == 3);
    std::cout << "[PASS] Transient status errors do not end the job." << std::endl;
}

void TestProviderErrorAndAuthFailure() {
    test::ManualScheduler scheduler;
    test::ScriptedProvider provider;
    JobPoller poller(provider, scheduler, FastConfig());

    provider.onStatus = [](const std::string&) {
        domain::JobStatusReport report;
        report.state = ProviderJobState::Error;
        report.error = "audio has no speech";
        return report;
    };
    std::optional<TranscriptionError> failure;
    poller.start("job-e", 30, nullptr, nullptr,
        [&](const std::string&, const TranscriptionError& e) { failure = e; });
    scheduler.runAll();
    assert(failure && failure->kind() == ErrorKind::JobFailed);
    assert(std::string(failure->what()) == "audio has no speech");

    provider.onStatus = [](const std::string&) -> domain::JobStatusReport {
        throw TranscriptionError(ErrorKind::AuthOrBilling, "401");
    };
    failure.reset();
    poller.start("job-a", 30, nullptr, nullptr,
        [&](const std::string&, const TranscriptionError& e) { failure = e; });
    scheduler.runAll();
    assert(failure && failure->kind() == ErrorKind::AuthOrBilling);
    assert(poller.ticks() == 1);
    std::cout << "[PASS] Provider job errors and auth failures are terminal." << std::endl;
}

void TestCancelStopsTimer() {
    test::ManualScheduler scheduler;
    test::ScriptedProvider provider;
    JobPoller poller(provider, scheduler, FastConfig());
    provider.onStatus = [](const std::string&) { return test::StatusReport(ProviderJobState::Processing, 10); };

    bool terminal = false;
    poller.start("job-c", 30, nullptr,
        [&](const std::string&, const domain::TranscriptResult&) { terminal = true; },
        [&](const std::string&, const TranscriptionError&) { terminal = true; });
    scheduler.advance(seconds(11));
    assert(poller.ticks() == 2);
    poller.cancel();
    assert(!poller.isActive());
    assert(scheduler.pending() == 0);
    scheduler.advance(seconds(60));
    assert(poller.ticks() == 2);
    assert(!terminal);
    assert(!poller.isFinalized("job-c"));
    std::cout << "[PASS] Cancel clears the scheduled tick." << std::endl;
}

void TestFinalizedIdsAreBounded() {
    test::ManualScheduler scheduler;
    test::ScriptedProvider provider;
    JobPoller poller(provider, scheduler, FastConfig());
    provider.onStatus = [](const std::string&) { return test::CompletedReport("done", 1.0); };

    const std::size_t total = JobPoller::kMaxRememberedJobs + 10;
    int completions = 0;
    for (std::size_t i = 0; i < total; ++i) {
        assert(poller.start("job-" + std::to_string(i), 30,
            [](const PollUpdate&) {},
            [&](const std::string&, const domain::TranscriptResult&) { ++completions; },
            [](const std::string&, const TranscriptionError&) { assert(false); }));
        scheduler.runAll();
    }
    assert(completions == static_cast<int>(total));

    // The oldest ids have been forgotten; the most recent ones are still refused.
    assert(!poller.isFinalized("job-0"));
    assert(!poller.isFinalized("job-9"));
    assert(poller.isFinalized("job-10"));
    assert(poller.isFinalized("job-" + std::to_string(total - 1)));
    assert(!poller.start("job-" + std::to_string(total - 1), 30, nullptr, nullptr, nullptr));
    std::cout << "[PASS] Only the most recent finalized job ids are remembered." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting JobPoller Test..." << std::endl;
    TestPollsUntilCompleted();
    TestTerminalHandledExactlyOnce();
    TestCeilingStopsPolling();
    TestHeuristicProgressWithoutProviderPercent();
    TestTransientStatusErrorsKeepPolling();
    TestProviderErrorAndAuthFailure();
    TestCancelStopsTimer();
    TestFinalizedIdsAreBounded();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}

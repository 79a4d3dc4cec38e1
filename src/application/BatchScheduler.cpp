/**
 * @file BatchScheduler.cpp
 * @brief Implementation of BatchScheduler.
 */

#include "application/BatchScheduler.hpp"

#include <iostream>
#include <sstream>

namespace scribeline::application {

namespace {
// How long to wait before retrying a submission while a resumed job still holds the slot.
constexpr std::chrono::milliseconds kBusyRetryDelay{1000};
}

BatchScheduler::BatchScheduler(TranscriptionPipeline& pipeline, domain::Scheduler& scheduler)
    : m_pipeline(pipeline), m_scheduler(scheduler) {}

void BatchScheduler::setAdmissionCheck(AdmissionCheck check) {
    m_admission = std::move(check);
}

void BatchScheduler::setFileObserver(OnFileFinished observer) {
    m_fileObserver = std::move(observer);
}

bool BatchScheduler::run(std::vector<std::shared_ptr<const domain::MediaSource>> files, OnBatchFinished onFinished) {
    if (m_running) {
        std::cerr << "[Batch] A batch is already running" << std::endl;
        return false;
    }
    m_files = std::move(files);
    m_onFinished = std::move(onFinished);
    m_next = 0;
    m_state = BatchState{};
    m_state.total = m_files.size();
    m_running = true;
    std::cout << "[Batch] Starting batch of " << m_state.total << " file(s)" << std::endl;
    m_scheduler.schedule(std::chrono::milliseconds{0}, [this]() { processNext(); });
    return true;
}

void BatchScheduler::processNext() {
    if (m_next >= m_files.size()) {
        m_running = false;
        m_state.currentFile.clear();
        BatchSummary summary = Summarize(m_state);
        std::cout << "[Batch] Finished: " << summary.succeeded << " succeeded, " << summary.failed << " failed"
                  << std::endl;
        OnBatchFinished callback = std::move(m_onFinished);
        m_onFinished = nullptr;
        if (callback) callback(summary);
        return;
    }

    if (m_pipeline.isBusy()) {
        m_scheduler.schedule(kBusyRetryDelay, [this]() { processNext(); });
        return;
    }

    const auto& source = m_files[m_next];
    const domain::SourceFile file = source->describe();
    m_state.currentFile = file.name;
    std::cout << "[Batch] File " << (m_next + 1) << "/" << m_state.total << ": " << file.name << std::endl;

    if (m_admission) {
        if (auto rejection = m_admission(file)) {
            FileResult result;
            result.fileName = file.name;
            result.error = *rejection;
            record(std::move(result));
            return;
        }
    }

    const bool accepted = m_pipeline.submit(source, [this](const JobOutcome& outcome) {
        FileResult result;
        result.fileName = outcome.job.sourceFile.name;
        result.success = outcome.succeeded();
        result.jobId = outcome.job.id;
        result.error = outcome.error;
        result.transcript = outcome.result;
        record(std::move(result));
    });
    if (!accepted) {
        m_scheduler.schedule(kBusyRetryDelay, [this]() { processNext(); });
    }
}

void BatchScheduler::record(FileResult result) {
    if (!result.success && result.error) {
        std::cerr << "[Batch] " << result.fileName << " failed: " << result.error->describe() << std::endl;
    }
    m_state.perFileResults.push_back(std::move(result));
    m_state.completedCount += 1;
    m_next += 1;
    if (m_fileObserver) {
        m_fileObserver(m_state.perFileResults.back(), m_state);
    }
    m_scheduler.schedule(std::chrono::milliseconds{0}, [this]() { processNext(); });
}

BatchSummary BatchScheduler::Summarize(const BatchState& state) {
    BatchSummary summary;
    summary.results = state.perFileResults;
    for (const auto& result : state.perFileResults) {
        if (result.success) {
            ++summary.succeeded;
        } else {
            ++summary.failed;
        }
    }
    return summary;
}

std::string BatchScheduler::FormatSummary(const BatchSummary& summary) {
    std::ostringstream out;
    out << summary.succeeded << " succeeded, " << summary.failed << " failed\n";
    for (const auto& result : summary.results) {
        if (result.success) {
            out << "  [ok]     " << result.fileName;
            if (result.jobId) out << " (job " << *result.jobId << ")";
            out << "\n";
        } else {
            out << "  [failed] " << result.fileName;
            if (result.error) {
                out << ": " << result.error->describe() << "\n";
                out << "           " << result.error->remediation();
            }
            out << "\n";
        }
    }
    return out.str();
}

} // namespace scribeline::application

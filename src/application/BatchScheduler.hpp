/**
 * @file BatchScheduler.hpp
 * @brief Runs several files through the pipeline one after another.
 */

#pragma once

#include "application/TranscriptionPipeline.hpp"
#include "domain/MediaSource.hpp"
#include "domain/Scheduler.hpp"
#include "domain/TranscriptionError.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace scribeline::application {

struct FileResult {
    std::string fileName;
    bool success = false;
    std::optional<std::string> jobId;
    std::optional<domain::TranscriptionError> error;
    std::optional<domain::TranscriptResult> transcript;
};

struct BatchState {
    std::size_t total = 0;
    std::size_t completedCount = 0;
    std::string currentFile;
    std::vector<FileResult> perFileResults;
};

struct BatchSummary {
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::vector<FileResult> results;
};

/**
 * @class BatchScheduler
 * @brief Sequential batch runner. A failing file is recorded and the batch moves on.
 */
class BatchScheduler {
public:
    using OnBatchFinished = std::function<void(const BatchSummary&)>;
    using OnFileFinished = std::function<void(const FileResult&, const BatchState&)>;
    /// Returns an error to skip the file without submitting it.
    using AdmissionCheck = std::function<std::optional<domain::TranscriptionError>(const domain::SourceFile&)>;

    BatchScheduler(TranscriptionPipeline& pipeline, domain::Scheduler& scheduler);

    void setAdmissionCheck(AdmissionCheck check);
    void setFileObserver(OnFileFinished observer);

    /**
     * @brief Starts the batch on the next scheduler turn.
     * @return False if a batch is already running.
     */
    bool run(std::vector<std::shared_ptr<const domain::MediaSource>> files, OnBatchFinished onFinished);

    bool isRunning() const { return m_running; }
    const BatchState& state() const { return m_state; }

    static BatchSummary Summarize(const BatchState& state);
    static std::string FormatSummary(const BatchSummary& summary);

private:
    void processNext();
    void record(FileResult result);

    TranscriptionPipeline& m_pipeline;
    domain::Scheduler& m_scheduler;
    AdmissionCheck m_admission;
    OnFileFinished m_fileObserver;
    OnBatchFinished m_onFinished;
    std::vector<std::shared_ptr<const domain::MediaSource>> m_files;
    std::size_t m_next = 0;
    BatchState m_state;
    bool m_running = false;
};

} // namespace scribeline::application

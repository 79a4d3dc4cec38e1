/**
 * @file TranscriptionJob.hpp
 * @brief Core value types for one unit of transcription work.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace scribeline::domain {

/**
 * @enum Provider
 * @brief Which transcription route a job is using.
 */
enum class Provider {
    Primary,   ///< Asynchronous provider, direct upload + job polling.
    Fallback   ///< Size-capped synchronous route.
};

/**
 * @enum JobStatus
 * @brief Lifecycle states of a TranscriptionJob. Completed and Failed are absorbing.
 */
enum class JobStatus {
    Idle,
    Preparing,
    PreparingChunks,
    Uploading,
    ProcessingChunks,
    Transcribing,
    CombiningResults,
    Completed,
    Failed
};

inline std::string ProviderToString(Provider provider) {
    return provider == Provider::Fallback ? "fallback" : "primary";
}

inline Provider ParseProvider(const std::string& value) {
    return value == "fallback" ? Provider::Fallback : Provider::Primary;
}

inline std::string StatusToString(JobStatus status) {
    switch (status) {
        case JobStatus::Idle: return "idle";
        case JobStatus::Preparing: return "preparing";
        case JobStatus::PreparingChunks: return "preparing_chunks";
        case JobStatus::Uploading: return "uploading";
        case JobStatus::ProcessingChunks: return "processing_chunks";
        case JobStatus::Transcribing: return "transcribing";
        case JobStatus::CombiningResults: return "combining_results";
        case JobStatus::Completed: return "completed";
        case JobStatus::Failed: return "failed";
    }
    return "idle";
}

/**
 * @brief Parses the persisted status name. Unknown names map to nullopt.
 */
inline std::optional<JobStatus> ParseStatus(const std::string& value) {
    static const JobStatus all[] = {
        JobStatus::Idle, JobStatus::Preparing, JobStatus::PreparingChunks,
        JobStatus::Uploading, JobStatus::ProcessingChunks, JobStatus::Transcribing,
        JobStatus::CombiningResults, JobStatus::Completed, JobStatus::Failed
    };
    for (JobStatus status : all) {
        if (StatusToString(status) == value) return status;
    }
    return std::nullopt;
}

inline bool IsTerminal(JobStatus status) {
    return status == JobStatus::Completed || status == JobStatus::Failed;
}

/**
 * @struct SourceFile
 * @brief Metadata of the media file being transcribed.
 */
struct SourceFile {
    std::string name;
    std::uint64_t byteSize = 0;
    std::string mimeType;
};

/**
 * @struct ChunkTask
 * @brief Byte range [byteStart, byteEnd) of a file uploaded as an independent transfer.
 */
struct ChunkTask {
    std::size_t index = 0;
    std::uint64_t byteStart = 0;
    std::uint64_t byteEnd = 0;
    std::string derivedFilename;

    std::uint64_t length() const { return byteEnd - byteStart; }
};

/**
 * @struct TranscriptResult
 * @brief Final transcript handed to the caller once a job completes.
 */
struct TranscriptResult {
    std::string text;
    double durationSeconds = 0.0;
};

/**
 * @struct TranscriptionJob
 * @brief One unit of work tracked from file selection to its terminal state.
 */
struct TranscriptionJob {
    std::optional<std::string> id; ///< Provider job id, absent until the provider accepts the upload.
    SourceFile sourceFile;
    Provider provider = Provider::Primary;
    JobStatus status = JobStatus::Idle;
    int progressPercent = 0;
    long long etaSeconds = 0;
    std::vector<ChunkTask> chunks; ///< Empty for single-shot uploads.
    std::chrono::system_clock::time_point createdAt{};
    std::optional<std::chrono::system_clock::time_point> completedAt;

    bool isChunked() const { return !chunks.empty(); }
};

} // namespace scribeline::domain

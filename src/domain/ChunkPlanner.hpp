/**
 * @file ChunkPlanner.hpp
 * @brief Decides between a single-shot upload and a chunked upload for a file size.
 */

#pragma once

#include "domain/TranscriptionJob.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace scribeline::domain {

/**
 * @struct ChunkingPolicy
 * @brief Size limits used by the planner.
 */
struct ChunkingPolicy {
    /// Largest payload the gateway in front of the direct-upload path accepts in one request.
    std::uint64_t directUploadThresholdBytes = 4ull * 1024 * 1024;
    /// Nominal size of each chunk when the file is over the threshold.
    std::uint64_t chunkSizeBytes = 3ull * 1024 * 1024;
};

/**
 * @struct UploadPlan
 * @brief Ordered chunks covering [0, byteSize) exactly. A single-shot plan has one chunk.
 */
struct UploadPlan {
    bool chunked = false;
    std::vector<ChunkTask> chunks;
};

class ChunkPlanner {
public:
    /**
     * @brief Rejects files that cannot be planned.
     * @throws TranscriptionError (Validation) for zero-byte or unreadable files.
     */
    static void ValidateSource(const SourceFile& file, bool readable);

    /**
     * @brief Builds the upload plan. Deterministic and side-effect free.
     * @throws TranscriptionError (Validation) for a zero byte size.
     * @throws std::invalid_argument for a zero chunk size.
     */
    static UploadPlan Plan(const SourceFile& file, const ChunkingPolicy& policy);

    /** @brief "<stem>.partNNNofMMM<ext>", 1-based and zero-padded to three digits. */
    static std::string DeriveChunkFilename(const std::string& fileName, std::size_t index, std::size_t total);
};

} // namespace scribeline::domain

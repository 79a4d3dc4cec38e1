/**
 * @file ChunkPlanner.cpp
 * @brief Implementation of ChunkPlanner.
 */

#include "domain/ChunkPlanner.hpp"
#include "domain/TranscriptionError.hpp"

#include <cstdio>
#include <stdexcept>

namespace scribeline::domain {

void ChunkPlanner::ValidateSource(const SourceFile& file, bool readable) {
    if (!readable) {
        throw TranscriptionError(ErrorKind::Validation, "File is not readable: " + file.name);
    }
    if (file.byteSize == 0) {
        throw TranscriptionError(ErrorKind::Validation, "File is empty: " + file.name);
    }
}

UploadPlan ChunkPlanner::Plan(const SourceFile& file, const ChunkingPolicy& policy) {
    if (file.byteSize == 0) {
        throw TranscriptionError(ErrorKind::Validation, "File is empty: " + file.name);
    }
    if (policy.chunkSizeBytes == 0) {
        throw std::invalid_argument("ChunkPlanner: chunk size must be positive.");
    }

    UploadPlan plan;
    if (file.byteSize <= policy.directUploadThresholdBytes) {
        plan.chunked = false;
        plan.chunks.push_back(ChunkTask{0, 0, file.byteSize, file.name});
        return plan;
    }

    const std::uint64_t size = file.byteSize;
    const std::uint64_t step = policy.chunkSizeBytes;
    const std::size_t total = static_cast<std::size_t>(size / step + (size % step != 0 ? 1 : 0));

    plan.chunked = true;
    plan.chunks.reserve(total);
    for (std::size_t i = 0; i < total; ++i) {
        std::uint64_t start = static_cast<std::uint64_t>(i) * step;
        std::uint64_t end = (size - start > step) ? start + step : size;
        plan.chunks.push_back(ChunkTask{i, start, end, DeriveChunkFilename(file.name, i, total)});
    }
    return plan;
}

std::string ChunkPlanner::DeriveChunkFilename(const std::string& fileName, std::size_t index, std::size_t total) {
    std::string stem = fileName;
    std::string ext;
    size_t lastDot = fileName.find_last_of('.');
    if (lastDot != std::string::npos && lastDot != 0) {
        stem = fileName.substr(0, lastDot);
        ext = fileName.substr(lastDot);
    }

    char part[48];
    std::snprintf(part, sizeof(part), ".part%03zuof%03zu", index + 1, total);
    return stem + part + ext;
}

} // namespace scribeline::domain

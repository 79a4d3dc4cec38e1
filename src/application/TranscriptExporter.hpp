/**
 * @file TranscriptExporter.hpp
 * @brief Writes finished transcripts of a batch to text files.
 */

#pragma once

#include "application/BatchScheduler.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace scribeline::application {

class TranscriptExporter {
public:
    /** @brief "<stem>-transcript.txt" for a source file name. */
    static std::string TranscriptFileName(const std::string& sourceName);

    /** @brief "=== name ===\n\ntext\n\n" blocks for every successful file, in batch order. */
    static std::string ToCombinedText(const std::vector<FileResult>& results);

    /**
     * @brief Writes one file per successful transcript plus the combined transcriptions.txt.
     * @return Paths written, combined file last. Nothing is written when no file succeeded.
     * @throws std::runtime_error if a file cannot be written.
     */
    static std::vector<std::filesystem::path> ExportBatch(const BatchSummary& summary,
                                                          const std::filesystem::path& outputDir);
};

} // namespace scribeline::application

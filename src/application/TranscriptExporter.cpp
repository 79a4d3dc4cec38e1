/**
 * @file TranscriptExporter.cpp
 * @brief Implementation of TranscriptExporter.
 */

#include "application/TranscriptExporter.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace scribeline::application {

namespace fs = std::filesystem;

namespace {

void WriteTextFile(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open " + path.string() + " for writing");
    }
    out << content;
    if (out.fail()) {
        throw std::runtime_error("Write failed for " + path.string());
    }
}

} // namespace

std::string TranscriptExporter::TranscriptFileName(const std::string& sourceName) {
    return fs::path(sourceName).stem().string() + "-transcript.txt";
}

std::string TranscriptExporter::ToCombinedText(const std::vector<FileResult>& results) {
    std::stringstream ss;
    for (const auto& result : results) {
        if (!result.success || !result.transcript) continue;
        ss << "=== " << result.fileName << " ===\n\n";
        ss << result.transcript->text << "\n\n";
    }
    return ss.str();
}

std::vector<fs::path> TranscriptExporter::ExportBatch(const BatchSummary& summary, const fs::path& outputDir) {
    std::vector<fs::path> written;
    if (summary.succeeded == 0) {
        return written;
    }
    fs::create_directories(outputDir);

    for (const auto& result : summary.results) {
        if (!result.success || !result.transcript) continue;
        fs::path target = outputDir / TranscriptFileName(result.fileName);
        WriteTextFile(target, result.transcript->text);
        written.push_back(target);
    }

    fs::path combined = outputDir / "transcriptions.txt";
    WriteTextFile(combined, ToCombinedText(summary.results));
    written.push_back(combined);
    std::cout << "[Export] Wrote " << written.size() << " file(s) to " << outputDir.string() << std::endl;
    return written;
}

} // namespace scribeline::application

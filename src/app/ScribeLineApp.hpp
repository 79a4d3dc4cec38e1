/**
 * @file ScribeLineApp.hpp
 * @brief Command-line application: resume, batch transcription, summary and export.
 */

#pragma once

#include "application/AppServices.hpp"
#include "application/PipelineConfig.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace scribeline::app {

/**
 * @struct CommandLine
 * @brief Parsed arguments of `scribeline [options] FILE...`.
 */
struct CommandLine {
    std::optional<std::filesystem::path> configPath;
    std::optional<std::filesystem::path> statePath;
    std::filesystem::path outputDir = ".";
    bool assumeYes = false;
    bool cancelPersisted = false;
    std::vector<std::string> files;
};

/**
 * @class ScribeLineApp
 * @brief Orchestrates the application lifecycle: initialization, the event loop runs, and shutdown.
 */
class ScribeLineApp {
public:
    /**
     * @brief Parses argv (without the program name).
     * @param error Set when parsing fails; left empty when help was requested.
     */
    static std::optional<CommandLine> ParseArgs(const std::vector<std::string>& args, std::string& error);

    static std::string Usage();

    explicit ScribeLineApp(CommandLine commandLine);

    /**
     * @brief Runs the whole session.
     * @return 0 when every file succeeded, 1 when any failed.
     */
    int Run();

private:
    /**
     * @brief Loads the configuration and wires the services.
     * @return True if initialization succeeded.
     */
    bool Init();

    /** @brief Finishes or discards a job left over by a previous run. Returns false if it failed. */
    bool ResumePersistedJob();

    int RunBatch();

    void Shutdown();

    void ReportProgress(const domain::TranscriptionJob& job);

    CommandLine m_commandLine;
    application::PipelineConfig m_config;
    application::AppServices m_services;
    domain::JobStatus m_lastStatus = domain::JobStatus::Idle;
    int m_lastPercent = -1;
};

} // namespace scribeline::app

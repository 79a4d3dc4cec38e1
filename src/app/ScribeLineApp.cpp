/**
 * @file ScribeLineApp.cpp
 * @brief Implementation of the ScribeLineApp class.
 */

#include "app/ScribeLineApp.hpp"

#include "application/EtaEstimator.hpp"
#include "application/TranscriptExporter.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/FileMediaSource.hpp"
#include "infrastructure/FileProgressStateStore.hpp"
#include "infrastructure/HttpCredentialBroker.hpp"
#include "infrastructure/HttpTranscriptionProvider.hpp"
#include "infrastructure/PathUtils.hpp"

#include <iostream>
#include <stdexcept>
#include <sstream>

namespace scribeline::app {

namespace fs = std::filesystem;

std::string ScribeLineApp::Usage() {
    std::ostringstream out;
    out << "Usage: scribeline [options] FILE...\n"
        << "\n"
        << "Uploads audio files and transcribes them one after another.\n"
        << "\n"
        << "Options:\n"
        << "  --config FILE      settings file (default: $XDG_CONFIG_HOME/scribeline/settings.json)\n"
        << "  --state FILE       in-flight job record (default: $XDG_DATA_HOME/scribeline/active_job.json)\n"
        << "  --output-dir DIR   where transcripts are written (default: current directory)\n"
        << "  --yes              submit files whose estimated cost needs confirmation\n"
        << "  --cancel           discard a job left over by a previous run instead of resuming it\n"
        << "  -h, --help         show this help\n";
    return out.str();
}

std::optional<CommandLine> ScribeLineApp::ParseArgs(const std::vector<std::string>& args, std::string& error) {
    CommandLine cmd;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto needValue = [&](const char* option) -> std::optional<std::string> {
            if (i + 1 >= args.size()) {
                error = std::string(option) + " requires a value";
                return std::nullopt;
            }
            return args[++i];
        };

        if (arg == "-h" || arg == "--help") {
            error.clear();
            return std::nullopt;
        } else if (arg == "--config") {
            auto value = needValue("--config");
            if (!value) return std::nullopt;
            cmd.configPath = *value;
        } else if (arg == "--state") {
            auto value = needValue("--state");
            if (!value) return std::nullopt;
            cmd.statePath = *value;
        } else if (arg == "--output-dir") {
            auto value = needValue("--output-dir");
            if (!value) return std::nullopt;
            cmd.outputDir = *value;
        } else if (arg == "--yes") {
            cmd.assumeYes = true;
        } else if (arg == "--cancel") {
            cmd.cancelPersisted = true;
        } else if (arg.size() > 1 && arg[0] == '-' && arg != "-") {
            error = "Unknown option " + arg;
            return std::nullopt;
        } else {
            cmd.files.push_back(arg);
        }
    }
    return cmd;
}

ScribeLineApp::ScribeLineApp(CommandLine commandLine) : m_commandLine(std::move(commandLine)) {}

bool ScribeLineApp::Init() {
    const fs::path settingsPath = m_commandLine.configPath.value_or(infrastructure::PathUtils::GetDefaultSettingsFile());
    m_config = infrastructure::ConfigLoader::Load(settingsPath);
    if (m_commandLine.statePath) {
        m_config.stateFile = m_commandLine.statePath->string();
    }
    if (m_config.stateFile.empty()) {
        m_config.stateFile = infrastructure::PathUtils::GetDefaultStateFile().string();
    }
    try {
        infrastructure::ConfigLoader::ValidateChunking(m_config.chunking);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[ScribeLine] " << e.what() << " (" << settingsPath << ")" << std::endl;
        return false;
    }

    // Dependency Injection / Composition Root
    m_services.eventLoop = std::make_unique<infrastructure::EventLoop>();
    m_services.broker = std::make_unique<infrastructure::HttpCredentialBroker>(m_config.endpoints.brokerBaseUrl);
    m_services.provider = std::make_unique<infrastructure::HttpTranscriptionProvider>(
        m_config.endpoints.providerBaseUrl, m_config.endpoints.fallbackBaseUrl);
    m_services.stateStore = std::make_unique<infrastructure::FileProgressStateStore>(m_config.stateFile);
    m_services.pipeline = std::make_unique<application::TranscriptionPipeline>(
        m_config, *m_services.broker, *m_services.provider, *m_services.stateStore, *m_services.eventLoop);
    m_services.batchScheduler = std::make_unique<application::BatchScheduler>(
        *m_services.pipeline, *m_services.eventLoop);
    m_services.costEstimator = std::make_unique<application::CostEstimator>(m_config.cost);

    m_services.pipeline->setProgressObserver([this](const domain::TranscriptionJob& job) {
        ReportProgress(job);
    });

    const bool assumeYes = m_commandLine.assumeYes;
    const application::CostEstimator& estimator = *m_services.costEstimator;
    m_services.batchScheduler->setAdmissionCheck(
        [assumeYes, &estimator](const domain::SourceFile& file) -> std::optional<domain::TranscriptionError> {
            const application::CostEstimate estimate = estimator.estimate(file.byteSize);
            std::cout << "[ScribeLine] " << file.name << ": " << application::CostEstimator::Describe(estimate)
                      << std::endl;
            if (estimate.requiresConfirmation && !assumeYes) {
                return domain::TranscriptionError(domain::ErrorKind::Validation,
                    "Estimated cost of " + file.name + " needs confirmation (" +
                    application::CostEstimator::Describe(estimate) + ")",
                    "Re-run with --yes to submit it.");
            }
            return std::nullopt;
        });

    std::cout << "[ScribeLine] Broker " << m_config.endpoints.brokerBaseUrl << ", state file "
              << m_config.stateFile << std::endl;
    return true;
}

void ScribeLineApp::ReportProgress(const domain::TranscriptionJob& job) {
    if (job.status == m_lastStatus && job.progressPercent == m_lastPercent) {
        return;
    }
    m_lastStatus = job.status;
    m_lastPercent = job.progressPercent;
    std::cout << "[Progress] " << job.sourceFile.name << ": " << domain::StatusToString(job.status) << " "
              << job.progressPercent << "%";
    if (!domain::IsTerminal(job.status) && job.etaSeconds > 0) {
        std::cout << " (ETA " << application::EtaEstimator::FormatEta(job.etaSeconds) << ")";
    }
    std::cout << std::endl;
}

bool ScribeLineApp::ResumePersistedJob() {
    if (m_commandLine.cancelPersisted) {
        if (auto saved = m_services.stateStore->get()) {
            std::cout << "[ScribeLine] Discarding in-flight job for " << saved->fileName << std::endl;
        }
        m_services.stateStore->clear();
        return true;
    }

    bool succeeded = true;
    const bool resumed = m_services.pipeline->resume([&succeeded](const application::JobOutcome& outcome) {
        succeeded = outcome.succeeded();
        if (outcome.error) {
            std::cerr << "[ScribeLine] Previous job for " << outcome.job.sourceFile.name << ": "
                      << outcome.error->describe() << "\n  " << outcome.error->remediation() << std::endl;
        } else if (outcome.result) {
            std::cout << "=== " << outcome.job.sourceFile.name << " ===\n\n" << outcome.result->text << "\n" << std::endl;
        }
    });
    if (resumed) {
        m_services.eventLoop->run();
    }
    return succeeded;
}

int ScribeLineApp::RunBatch() {
    std::vector<std::shared_ptr<const domain::MediaSource>> sources;
    sources.reserve(m_commandLine.files.size());
    for (const auto& file : m_commandLine.files) {
        sources.push_back(std::make_shared<infrastructure::FileMediaSource>(file));
    }

    std::optional<application::BatchSummary> summary;
    m_services.batchScheduler->run(std::move(sources), [&summary](const application::BatchSummary& result) {
        summary = result;
    });
    m_services.eventLoop->run();

    if (!summary) {
        std::cerr << "[ScribeLine] Batch did not finish" << std::endl;
        return 1;
    }

    std::cout << "\n" << application::BatchScheduler::FormatSummary(*summary) << std::endl;
    try {
        application::TranscriptExporter::ExportBatch(*summary, m_commandLine.outputDir);
    } catch (const std::exception& e) {
        std::cerr << "[ScribeLine] Export failed: " << e.what() << std::endl;
        return 1;
    }
    return summary->failed == 0 ? 0 : 1;
}

void ScribeLineApp::Shutdown() {
    if (m_services.eventLoop) {
        m_services.eventLoop->stop();
    }
    m_services.costEstimator.reset();
    m_services.batchScheduler.reset();
    m_services.pipeline.reset();
    m_services.stateStore.reset();
    m_services.provider.reset();
    m_services.broker.reset();
    m_services.eventLoop.reset();
}

int ScribeLineApp::Run() {
    if (!Init()) {
        Shutdown();
        return 1;
    }

    int exitCode = ResumePersistedJob() ? 0 : 1;
    if (!m_commandLine.files.empty()) {
        const int batchCode = RunBatch();
        if (batchCode != 0) exitCode = batchCode;
    }

    Shutdown();
    return exitCode;
}

} // namespace scribeline::app

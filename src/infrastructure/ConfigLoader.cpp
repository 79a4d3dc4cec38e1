/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace scribeline::infrastructure {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

void OverrideFromEnv(const char* name, std::string& target) {
    const char* value = std::getenv(name);
    if (value && *value) {
        target = value;
    }
}

} // namespace

void ConfigLoader::ValidateChunking(const domain::ChunkingPolicy& chunking) {
    if (chunking.chunkSizeBytes == 0) {
        throw std::invalid_argument("chunking.chunkSizeBytes must be positive");
    }
    if (chunking.chunkSizeBytes > chunking.directUploadThresholdBytes) {
        throw std::invalid_argument("chunking.chunkSizeBytes (" + std::to_string(chunking.chunkSizeBytes) +
                                    ") exceeds directUploadThresholdBytes (" +
                                    std::to_string(chunking.directUploadThresholdBytes) + ")");
    }
}

void ConfigLoader::ApplyJson(const json& j, application::PipelineConfig& config) {
    if (j.contains("chunking")) {
        const auto& c = j["chunking"];
        config.chunking.directUploadThresholdBytes = c.value("directUploadThresholdBytes", config.chunking.directUploadThresholdBytes);
        config.chunking.chunkSizeBytes = c.value("chunkSizeBytes", config.chunking.chunkSizeBytes);
        ValidateChunking(config.chunking);
    }
    if (j.contains("upload")) {
        const auto& u = j["upload"];
        config.upload.maxAttempts = u.value("maxAttempts", config.upload.maxAttempts);
        config.upload.timeoutFloor = std::chrono::seconds(u.value("timeoutFloorSeconds", static_cast<long long>(config.upload.timeoutFloor.count())));
        config.upload.minThroughputBytesPerSecond = u.value("minThroughputBytesPerSecond", config.upload.minThroughputBytesPerSecond);
        config.upload.timeoutBuffer = std::chrono::seconds(u.value("timeoutBufferSeconds", static_cast<long long>(config.upload.timeoutBuffer.count())));
    }
    if (j.contains("poller")) {
        const auto& p = j["poller"];
        config.poller.interval = std::chrono::seconds(p.value("intervalSeconds", static_cast<long long>(config.poller.interval.count())));
        config.poller.ceiling = std::chrono::seconds(p.value("ceilingSeconds", static_cast<long long>(config.poller.ceiling.count())));
    }
    if (j.contains("endpoints")) {
        const auto& e = j["endpoints"];
        config.endpoints.brokerBaseUrl = e.value("brokerBaseUrl", config.endpoints.brokerBaseUrl);
        config.endpoints.providerBaseUrl = e.value("providerBaseUrl", config.endpoints.providerBaseUrl);
        config.endpoints.fallbackBaseUrl = e.value("fallbackBaseUrl", config.endpoints.fallbackBaseUrl);
    }
    if (j.contains("cost")) {
        const auto& c = j["cost"];
        config.cost.costPerHourUsd = c.value("costPerHourUsd", config.cost.costPerHourUsd);
        config.cost.megabytesPerHour = c.value("megabytesPerHour", config.cost.megabytesPerHour);
        config.cost.confirmAboveUsd = c.value("confirmAboveUsd", config.cost.confirmAboveUsd);
    }
    config.speakerLabels = j.value("speakerLabels", config.speakerLabels);
    config.maxFileSizeBytes = j.value("maxFileSizeBytes", config.maxFileSizeBytes);
    config.stateFile = j.value("stateFile", config.stateFile);
}

json ConfigLoader::ToJson(const application::PipelineConfig& config) {
    return json{
        {"chunking", {
            {"directUploadThresholdBytes", config.chunking.directUploadThresholdBytes},
            {"chunkSizeBytes", config.chunking.chunkSizeBytes}
        }},
        {"upload", {
            {"maxAttempts", config.upload.maxAttempts},
            {"timeoutFloorSeconds", config.upload.timeoutFloor.count()},
            {"minThroughputBytesPerSecond", config.upload.minThroughputBytesPerSecond},
            {"timeoutBufferSeconds", config.upload.timeoutBuffer.count()}
        }},
        {"poller", {
            {"intervalSeconds", config.poller.interval.count()},
            {"ceilingSeconds", config.poller.ceiling.count()}
        }},
        {"endpoints", {
            {"brokerBaseUrl", config.endpoints.brokerBaseUrl},
            {"providerBaseUrl", config.endpoints.providerBaseUrl},
            {"fallbackBaseUrl", config.endpoints.fallbackBaseUrl}
        }},
        {"cost", {
            {"costPerHourUsd", config.cost.costPerHourUsd},
            {"megabytesPerHour", config.cost.megabytesPerHour},
            {"confirmAboveUsd", config.cost.confirmAboveUsd}
        }},
        {"speakerLabels", config.speakerLabels},
        {"maxFileSizeBytes", config.maxFileSizeBytes},
        {"stateFile", config.stateFile}
    };
}

void ConfigLoader::ApplyEnvironment(application::PipelineConfig& config) {
    OverrideFromEnv("SCRIBELINE_BROKER_URL", config.endpoints.brokerBaseUrl);
    OverrideFromEnv("SCRIBELINE_PROVIDER_URL", config.endpoints.providerBaseUrl);
    OverrideFromEnv("SCRIBELINE_FALLBACK_URL", config.endpoints.fallbackBaseUrl);
    OverrideFromEnv("SCRIBELINE_STATE_FILE", config.stateFile);
}

application::PipelineConfig ConfigLoader::Load(const fs::path& settingsPath) {
    application::PipelineConfig config;
    std::error_code ec;
    if (fs::exists(settingsPath, ec)) {
        try {
            std::ifstream f(settingsPath);
            json j;
            f >> j;
            application::PipelineConfig parsed = config;
            ApplyJson(j, parsed);
            config = parsed;
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Error reading " << settingsPath << ": " << e.what()
                      << "; using defaults" << std::endl;
        }
    }
    ApplyEnvironment(config);
    return config;
}

void ConfigLoader::Save(const fs::path& settingsPath, const application::PipelineConfig& config) {
    json j = json::object();

    // Load existing to preserve unknown keys
    std::error_code ec;
    if (fs::exists(settingsPath, ec)) {
        try {
            std::ifstream f(settingsPath);
            f >> j;
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Overwriting unreadable " << settingsPath << ": " << e.what() << std::endl;
            j = json::object();
        }
        if (!j.is_object()) {
            j = json::object();
        }
    }

    j.update(ToJson(config));

    if (settingsPath.has_parent_path()) {
        fs::create_directories(settingsPath.parent_path());
    }
    std::ofstream f(settingsPath, std::ios::trunc);
    if (!f.is_open()) {
        throw std::runtime_error("Cannot write " + settingsPath.string());
    }
    f << j.dump(4);
    if (f.fail()) {
        throw std::runtime_error("Write failed for " + settingsPath.string());
    }
}

} // namespace scribeline::infrastructure

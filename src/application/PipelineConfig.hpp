/**
 * @file PipelineConfig.hpp
 * @brief Tunables of the upload and transcription pipeline.
 */

#pragma once

#include "domain/ChunkPlanner.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace scribeline::application {

/**
 * @struct UploadPolicy
 * @brief Retry ceiling and size-scaled timeout parameters for one transfer.
 */
struct UploadPolicy {
    int maxAttempts = 3;
    std::chrono::seconds timeoutFloor{30};
    std::uint64_t minThroughputBytesPerSecond = 64 * 1024;
    std::chrono::seconds timeoutBuffer{15};
};

struct PollerConfig {
    std::chrono::seconds interval{5};
    std::chrono::seconds ceiling{4 * 60 * 60}; ///< Hard stop independent of any ETA.
};

struct EndpointConfig {
    std::string brokerBaseUrl = "http://localhost:8080";
    std::string providerBaseUrl = "http://localhost:8080";
    std::string fallbackBaseUrl = "http://localhost:8080";
};

/**
 * @struct CostConfig
 * @brief Rough cost model used to ask for confirmation before expensive jobs.
 */
struct CostConfig {
    double costPerHourUsd = 0.41;
    double megabytesPerHour = 30.0;
    double confirmAboveUsd = 1.00;
};

struct PipelineConfig {
    domain::ChunkingPolicy chunking;
    UploadPolicy upload;
    PollerConfig poller;
    EndpointConfig endpoints;
    CostConfig cost;
    bool speakerLabels = true;
    std::uint64_t maxFileSizeBytes = 5ull * 1024 * 1024 * 1024;
    std::string stateFile; ///< Empty means the default location under the XDG data home.
};

} // namespace scribeline::application

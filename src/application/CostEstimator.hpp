/**
 * @file CostEstimator.hpp
 * @brief Rough pre-submission cost estimate derived from the file size.
 */

#pragma once

#include "application/PipelineConfig.hpp"
#include "domain/TranscriptionJob.hpp"

#include <cstdint>
#include <string>

namespace scribeline::application {

struct CostEstimate {
    double audioHours = 0.0;
    double costUsd = 0.0;
    bool requiresConfirmation = false;
};

class CostEstimator {
public:
    explicit CostEstimator(CostConfig config);

    /** @brief Hours are approximated from the size at the configured megabytes per hour. */
    CostEstimate estimate(std::uint64_t fileSizeBytes) const;

    /** @brief "~1.5 h of audio, about $0.62". */
    static std::string Describe(const CostEstimate& estimate);

private:
    CostConfig m_config;
};

} // namespace scribeline::application

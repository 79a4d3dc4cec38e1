/**
 * @file CostEstimator.cpp
 * @brief Implementation of CostEstimator.
 */

#include "application/CostEstimator.hpp"

#include <iomanip>
#include <sstream>

namespace scribeline::application {

CostEstimator::CostEstimator(CostConfig config) : m_config(config) {}

CostEstimate CostEstimator::estimate(std::uint64_t fileSizeBytes) const {
    CostEstimate result;
    const double megabytes = static_cast<double>(fileSizeBytes) / (1024.0 * 1024.0);
    if (m_config.megabytesPerHour > 0.0) {
        result.audioHours = megabytes / m_config.megabytesPerHour;
    }
    result.costUsd = result.audioHours * m_config.costPerHourUsd;
    result.requiresConfirmation = result.costUsd > m_config.confirmAboveUsd;
    return result;
}

std::string CostEstimator::Describe(const CostEstimate& estimate) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << "~" << estimate.audioHours << " h of audio, about $"
        << std::setprecision(2) << estimate.costUsd;
    return out.str();
}

} // namespace scribeline::application

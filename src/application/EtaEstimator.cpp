/**
 * @file EtaEstimator.cpp
 * @brief Implementation of EtaEstimator.
 */

#include "application/EtaEstimator.hpp"

#include <algorithm>
#include <cmath>

namespace scribeline::application {

namespace {
constexpr long long kMinimumInitialEtaSeconds = 120;
constexpr double kSecondsPerMebibyte = 90.0;
constexpr long long kSecondsPerRemainingPercent = 3;
}

long long EtaEstimator::InitialEstimate(std::uint64_t fileSizeBytes) {
    double mebibytes = static_cast<double>(fileSizeBytes) / (1024.0 * 1024.0);
    long long estimate = static_cast<long long>(std::llround(mebibytes * kSecondsPerMebibyte));
    return std::max(kMinimumInitialEtaSeconds, estimate);
}

long long EtaEstimator::FromProviderProgress(int providerPercent, std::chrono::seconds elapsed) {
    if (providerPercent <= 0) return -1;
    if (providerPercent >= 100) return 0;
    long long t = std::max<long long>(0, elapsed.count());
    return (t * (100 - providerPercent)) / providerPercent;
}

long long EtaEstimator::Heuristic(int jobPercent) {
    int remaining = std::max(0, 100 - jobPercent);
    return remaining * kSecondsPerRemainingPercent;
}

std::string EtaEstimator::FormatEta(long long seconds) {
    if (seconds < 0) seconds = 0;
    if (seconds < 60) {
        return std::to_string(seconds) + "s";
    }
    if (seconds < 3600) {
        return std::to_string(seconds / 60) + "m " + std::to_string(seconds % 60) + "s";
    }
    return std::to_string(seconds / 3600) + "h " + std::to_string((seconds % 3600) / 60) + "m";
}

} // namespace scribeline::application

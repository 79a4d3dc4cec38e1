/**
 * @file EtaEstimator.hpp
 * @brief ETA heuristics for transcription jobs.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace scribeline::application {

class EtaEstimator {
public:
    /** @brief Estimate before the provider reports anything: max(120 s, 90 s per MiB). */
    static long long InitialEstimate(std::uint64_t fileSizeBytes);

    /**
     * @brief Extrapolates from provider-reported progress.
     * @param providerPercent Provider-side progress in [0, 100].
     * @param elapsed Time since polling started.
     * @return Remaining seconds, or -1 when providerPercent is not positive.
     */
    static long long FromProviderProgress(int providerPercent, std::chrono::seconds elapsed);

    /** @brief Fallback when the provider reports no progress: 3 s per remaining percent. */
    static long long Heuristic(int jobPercent);

    /** @brief "45s", "3m 20s", "1h 5m". */
    static std::string FormatEta(long long seconds);
};

} // namespace scribeline::application

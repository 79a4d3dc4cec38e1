/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving the pipeline configuration (settings.json).
 *
 * Keeps JSON parsing of settings in one place. Environment variables override the file:
 * SCRIBELINE_BROKER_URL, SCRIBELINE_PROVIDER_URL, SCRIBELINE_FALLBACK_URL, SCRIBELINE_STATE_FILE.
 */

#pragma once

#include "application/PipelineConfig.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>

namespace scribeline::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json. A missing file gives defaults; a malformed one is logged
     * and gives defaults. Environment overrides are applied last.
     */
    static application::PipelineConfig Load(const std::filesystem::path& settingsPath);

    /**
     * @brief Writes the configuration, preserving keys this version does not know about.
     * @throws std::runtime_error if the file cannot be written.
     */
    static void Save(const std::filesystem::path& settingsPath, const application::PipelineConfig& config);

    /**
     * @brief Rejects a zero chunk size or one larger than the direct-upload threshold.
     * @throws std::invalid_argument
     */
    static void ValidateChunking(const domain::ChunkingPolicy& chunking);

    /** @throws std::invalid_argument for an unusable chunking section. */
    static void ApplyJson(const nlohmann::json& j, application::PipelineConfig& config);
    static nlohmann::json ToJson(const application::PipelineConfig& config);
    static void ApplyEnvironment(application::PipelineConfig& config);
};

} // namespace scribeline::infrastructure

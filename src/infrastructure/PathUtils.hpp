/**
 * @file PathUtils.hpp
 * @brief XDG base-directory lookups for ScribeLine files.
 */

#pragma once
#include <filesystem>
#include <string>

namespace scribeline::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();

    /** @brief $XDG_DATA_HOME/scribeline */
    static std::filesystem::path GetAppDataDir();

    /** @brief $XDG_CONFIG_HOME/scribeline */
    static std::filesystem::path GetAppConfigDir();

    static std::filesystem::path GetDefaultSettingsFile();
    static std::filesystem::path GetDefaultStateFile();
};

} // namespace scribeline::infrastructure

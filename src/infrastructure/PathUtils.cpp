#include "infrastructure/PathUtils.hpp"
#include <cstdlib>

namespace scribeline::infrastructure {

namespace fs = std::filesystem;

namespace {
constexpr const char* kAppDirName = "scribeline";
}

fs::path PathUtils::GetDataHome() {
    const char* xdgDataHome = std::getenv("XDG_DATA_HOME");
    if (xdgDataHome && *xdgDataHome) {
        return fs::path(xdgDataHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".local" / "share";
    }
    return fs::current_path();
}

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetAppDataDir() {
    return GetDataHome() / kAppDirName;
}

fs::path PathUtils::GetAppConfigDir() {
    return GetConfigHome() / kAppDirName;
}

fs::path PathUtils::GetDefaultSettingsFile() {
    return GetAppConfigDir() / "settings.json";
}

fs::path PathUtils::GetDefaultStateFile() {
    // Directory is created lazily by the state store on first write.
    return GetAppDataDir() / "active_job.json";
}

} // namespace scribeline::infrastructure

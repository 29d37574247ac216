#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace healthexport::infrastructure {

namespace fs = std::filesystem;

namespace {

fs::path FromEnvOrHome(const char* variable, const char* homeRelative) {
    const char* value = std::getenv(variable);
    if (value && *value) {
        return fs::path(value);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / homeRelative;
    }
    return fs::current_path(); // Fallback
}

} // namespace

fs::path PathUtils::GetDataHome() {
    return FromEnvOrHome("XDG_DATA_HOME", ".local/share");
}

fs::path PathUtils::GetConfigHome() {
    return FromEnvOrHome("XDG_CONFIG_HOME", ".config");
}

// Not created here; ExportWriter creates it on first write.
fs::path PathUtils::GetExportsDir() {
    return GetDataHome() / "HealthExport" / "exports";
}

fs::path PathUtils::GetSettingsPath() {
    return GetConfigHome() / "HealthExport" / "settings.json";
}

} // namespace healthexport::infrastructure

// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace healthexport::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetExportsDir();
    static std::filesystem::path GetSettingsPath();
};

} // namespace healthexport::infrastructure

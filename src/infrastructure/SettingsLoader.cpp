/**
 * @file SettingsLoader.cpp
 * @brief Implementation of SettingsLoader.
 */

#include "infrastructure/SettingsLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace healthexport::infrastructure {

ExportSettings SettingsLoader::Defaults() {
    ExportSettings settings;
    settings.outputDir = PathUtils::GetExportsDir();
    return settings;
}

ExportSettings SettingsLoader::Load(const std::filesystem::path& settingsPath) {
    ExportSettings settings = Defaults();
    if (!std::filesystem::exists(settingsPath)) {
        return settings;
    }

    nlohmann::json j;
    try {
        std::ifstream f(settingsPath);
        f >> j;
    } catch (const std::exception& e) {
        std::cerr << "[SettingsLoader] Error reading " << settingsPath.string() << ": " << e.what() << std::endl;
        return settings;
    }

    try {
        if (j.contains("output_dir")) {
            settings.outputDir = j["output_dir"].get<std::string>();
        }
        if (j.contains("filename_timezone")) {
            std::string zone = j["filename_timezone"].get<std::string>();
            if (zone == "local") {
                settings.serializer.filenameTimeZone = FilenameTimeZone::Local;
            } else if (zone == "utc") {
                settings.serializer.filenameTimeZone = FilenameTimeZone::Utc;
            } else {
                std::cerr << "[SettingsLoader] Unknown filename_timezone '" << zone << "', using utc." << std::endl;
            }
        }
        if (j.contains("indent")) {
            int indent = j["indent"].get<int>();
            if (indent >= 1 && indent <= 8) {
                settings.serializer.indent = indent;
            } else {
                std::cerr << "[SettingsLoader] indent out of range (1-8): " << indent << std::endl;
            }
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[SettingsLoader] Invalid value in " << settingsPath.string() << ": " << e.what() << std::endl;
    }

    return settings;
}

} // namespace healthexport::infrastructure

/**
 * @file SettingsLoader.hpp
 * @brief Static utility for loading export settings (settings.json).
 *
 * Keys:
 *  - "output_dir": directory that receives exported documents.
 *  - "filename_timezone": "utc" (default) or "local", the zone used for the filename's day.
 *  - "indent": spaces per JSON indentation level, 1-8 (default 2).
 */

#pragma once

#include <filesystem>
#include "infrastructure/DocumentSerializer.hpp"

namespace healthexport::infrastructure {

struct ExportSettings {
    std::filesystem::path outputDir;
    SerializerOptions serializer;
};

class SettingsLoader {
public:
    /** @brief Defaults: output in PathUtils::GetExportsDir(), UTC filenames, indent 2. */
    static ExportSettings Defaults();

    /**
     * @brief Reads @p settingsPath over the defaults.
     *
     * A missing file yields the defaults. An unreadable file is reported on
     * stderr and ignored; a value of the wrong type is reported and stops
     * reading, leaving the remaining keys at their defaults.
     */
    static ExportSettings Load(const std::filesystem::path& settingsPath);
};

} // namespace healthexport::infrastructure

/**
 * @file ExportWriter.hpp
 * @brief Atomic file output for serialized export documents.
 */

#pragma once

#include <filesystem>
#include "infrastructure/DocumentSerializer.hpp"

namespace healthexport::infrastructure {

/**
 * @class ExportWriter
 * @brief Writes a document next to its final path and renames it into place,
 * so readers never observe a half-written file.
 */
class ExportWriter {
public:
    /**
     * @brief Writes @p document as @p directory / document.filename.
     * @return Final path of the written file.
     * @throws domain::ExportIoError if the directory or file cannot be written.
     */
    static std::filesystem::path Write(const SerializedDocument& document, const std::filesystem::path& directory);
};

} // namespace healthexport::infrastructure

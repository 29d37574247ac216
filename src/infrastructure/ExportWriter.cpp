/**
 * @file ExportWriter.cpp
 * @brief Implementation of ExportWriter.
 */

#include "infrastructure/ExportWriter.hpp"
#include "domain/ExportErrors.hpp"
#include <chrono>
#include <fstream>
#include <iostream>
#include <system_error>

namespace healthexport::infrastructure {

namespace fs = std::filesystem;

fs::path ExportWriter::Write(const SerializedDocument& document, const fs::path& directory) {
    if (document.filename.empty()) {
        throw domain::ExportIoError("Export document has no filename");
    }

    fs::path finalPath = directory / document.filename;

    // Unique temp path: <filename>.<timestamp>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    // 1. Ensure directory exists
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        throw domain::ExportIoError("Cannot create directory " + directory.string() + ": " + ec.message());
    }

    // 2. Write to temp
    {
        std::ofstream ofs(tempPath, std::ios::binary);
        if (!ofs.is_open()) {
            throw domain::ExportIoError("Failed to open temp file: " + tempPath.string());
        }
        ofs << document.bytes;
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            fs::remove(tempPath, ec);
            throw domain::ExportIoError("Write failed: " + tempPath.string());
        }
    }

    // 3. Atomic rename
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        throw domain::ExportIoError("Rename to " + finalPath.string() + " failed: " + ec.message());
    }

    std::clog << "[ExportWriter] Wrote " << document.bytes.size() << " bytes to " << finalPath.string() << std::endl;
    return finalPath;
}

} // namespace healthexport::infrastructure

/**
 * @file HealthExportCli.cpp
 * @brief Implementation of HealthExportCli.
 */

#include "app/HealthExportCli.hpp"

#include <exception>
#include <iostream>
#include "application/ExportAssembler.hpp"
#include "domain/ExportErrors.hpp"
#include "infrastructure/DocumentSerializer.hpp"
#include "infrastructure/ExportWriter.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/ProviderSnapshotLoader.hpp"
#include "infrastructure/SettingsLoader.hpp"

namespace healthexport::app {

void HealthExportCli::PrintUsage() {
    std::cerr << "Usage: healthexport <snapshot.json> <workout-id> [--out <dir>] [--settings <file>] [--stdout]\n"
              << "  --out <dir>        Directory for the exported document (overrides settings.json)\n"
              << "  --settings <file>  Settings file (default: " << infrastructure::PathUtils::GetSettingsPath().string() << ")\n"
              << "  --stdout           Print the document instead of writing it" << std::endl;
}

std::optional<CliOptions> HealthExportCli::ParseArgs(const std::vector<std::string>& args) {
    CliOptions options;
    std::vector<std::string> positional;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--stdout") {
            options.toStdout = true;
        } else if (arg == "--out" || arg == "--settings") {
            if (i + 1 >= args.size()) {
                std::cerr << "[healthexport] Missing value for " << arg << std::endl;
                PrintUsage();
                return std::nullopt;
            }
            if (arg == "--out") options.outputDir = args[++i];
            else options.settingsPath = args[++i];
        } else if (arg == "-h" || arg == "--help") {
            PrintUsage();
            return std::nullopt;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "[healthexport] Unknown option: " << arg << std::endl;
            PrintUsage();
            return std::nullopt;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 2) {
        PrintUsage();
        return std::nullopt;
    }
    options.snapshotPath = positional[0];
    options.workoutId = positional[1];
    return options;
}

int HealthExportCli::Run(const CliOptions& options) {
    const std::string settingsPath = options.settingsPath
        ? *options.settingsPath
        : infrastructure::PathUtils::GetSettingsPath().string();

    try {
        infrastructure::ExportSettings settings = infrastructure::SettingsLoader::Load(settingsPath);
        if (options.outputDir) {
            settings.outputDir = *options.outputDir;
        }

        auto provider = infrastructure::ProviderSnapshotLoader::LoadFile(options.snapshotPath);
        application::ExportAssembler assembler(provider);
        infrastructure::DocumentSerializer serializer(settings.serializer);

        auto document = assembler.buildExportById(options.workoutId);
        auto serialized = serializer.serialize(document);

        if (options.toStdout) {
            std::cout << serialized.bytes << std::endl;
        } else {
            auto path = infrastructure::ExportWriter::Write(serialized, settings.outputDir);
            std::cout << "[healthexport] Exported " << serialized.filename << " -> " << path.string() << std::endl;
        }
        return kExitOk;
    } catch (const domain::ExportError& e) {
        std::cerr << "[healthexport] Export failed: " << e.what() << std::endl;
        return kExitFailure;
    } catch (const std::exception& e) {
        std::cerr << "[healthexport] Unexpected error: " << e.what() << std::endl;
        return kExitFailure;
    }
}

} // namespace healthexport::app

/**
 * @file HealthExportCli.hpp
 * @brief Command-line front end: snapshot in, export document out.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace healthexport::app {

struct CliOptions {
    std::string snapshotPath;
    std::string workoutId;
    std::optional<std::string> outputDir;   ///< Overrides settings.json when set.
    std::optional<std::string> settingsPath;
    bool toStdout = false;
};

/**
 * @class HealthExportCli
 * @brief Parses arguments, runs one export, and reports the outcome.
 *
 * Exit codes: 0 success, 1 usage error, 2 export failure.
 */
class HealthExportCli {
public:
    static constexpr int kExitOk = 0;
    static constexpr int kExitUsage = 1;
    static constexpr int kExitFailure = 2;

    /** @return Parsed options, or std::nullopt after printing usage. */
    static std::optional<CliOptions> ParseArgs(const std::vector<std::string>& args);

    static int Run(const CliOptions& options);

    static void PrintUsage();
};

} // namespace healthexport::app

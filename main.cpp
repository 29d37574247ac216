#include <string>
#include <vector>

#include "app/HealthExportCli.hpp"

using namespace healthexport;

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    auto options = app::HealthExportCli::ParseArgs(args);
    if (!options) {
        return app::HealthExportCli::kExitUsage;
    }
    return app::HealthExportCli::Run(*options);
}

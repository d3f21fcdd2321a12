// File: src/cli/main.cpp
//
// Entry point of the cinecbr command-line tool
//
// Usage: cinecbr [--config <file.yaml>] [--cases <file.csv>] [--db <file.db>]

#include "cli/cinecbr_cli.hpp"
#include "cli/cli_config.hpp"
#include <iostream>
#include <string>

using namespace cinecbr;

namespace {

void PrintUsage(const char* program) {
    std::cerr << "Usage: " << program
              << " [--config <file.yaml>] [--cases <file.csv>] [--db <file.db>]\n";
}

} // anonymous namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::string cases_path;
    std::string db_path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "--cases" || arg == "--db") && i + 1 < argc) {
            std::string value = argv[++i];
            if (arg == "--config") config_path = value;
            else if (arg == "--cases") cases_path = value;
            else db_path = value;
        } else if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        } else {
            PrintUsage(argv[0]);
            return 1;
        }
    }

    CliConfig config = CliConfig::Default();
    if (!config_path.empty()) {
        auto loaded = CliConfig::LoadFromFile(config_path);
        if (!loaded) {
            std::cerr << "Fatal error: could not load configuration from " << config_path << "\n";
            return 1;
        }
        config = *loaded;
    }
    if (!cases_path.empty()) {
        config.data.case_file = cases_path;
    }
    if (!db_path.empty()) {
        config.data.database_file = db_path;
    }

    try {
        CineCli cli(config);
        cli.Run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

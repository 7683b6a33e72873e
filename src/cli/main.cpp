// File: src/cli/main.cpp
//
// Entry point of the medeq command-line tool
//
// Usage:
//   medeq [--config FILE] [--db PATH] [--verbose] [--no-color] [COMMAND ARGS...]
//
// Without a command the interactive prompt starts. With a command it runs
// once against the latest stored model and exits.

#include "cli/medeq_cli.hpp"
#include <iostream>
#include <string>

using namespace medeq;

static void PrintUsage(const char* program) {
    std::cout << "Usage: " << program
              << " [--config FILE] [--db PATH] [--verbose] [--no-color] [COMMAND ARGS...]\n"
              << "Run without a command for interactive mode; 'help' lists commands.\n";
}

int main(int argc, char** argv) {
    MedEqConfig config = MedEqConfig::Default();
    std::string db_override;
    bool verbose = false;
    bool no_color = false;
    std::string command;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (!command.empty()) {
            command += " " + arg;
        } else if (arg == "--config" && i + 1 < argc) {
            auto loaded = MedEqConfig::LoadFromFile(argv[++i]);
            if (!loaded) {
                return 1;
            }
            config = *loaded;
        } else if (arg == "--db" && i + 1 < argc) {
            db_override = argv[++i];
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "--no-color") {
            no_color = true;
        } else if (arg == "-h" || arg == "--help") {
            PrintUsage(argv[0]);
            return 0;
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Unknown option: " << arg << "\n";
            PrintUsage(argv[0]);
            return 1;
        } else {
            command = arg;
        }
    }

    if (!db_override.empty()) {
        config.interface.db_path = db_override;
    }
    if (verbose) {
        config.interface.verbose = true;
    }
    if (no_color) {
        config.interface.colors_enabled = false;
    }

    try {
        MedEqCli cli(config);
        if (command.empty()) {
            cli.Run();
            return 0;
        }

        cli.Initialize();
        return cli.ProcessCommand(command) ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}

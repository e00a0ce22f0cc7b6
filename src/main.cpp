#include <iostream>
#include <string>
#include <vector>
#include "cli/backset_cli.hpp"
#include "cli/theme.hpp"
#include "core/constants.hpp"

static void print_usage() {
    std::cout << theme::section("Usage");
    std::cout << theme::usage("backset", "[--config <file>]", "Run all configured backups");
    std::cout << theme::usage("backset status", "", "Show markers and the last run");
    std::cout << theme::usage("backset stop", "", "Pause future runs (create stop flag)");
    std::cout << theme::usage("backset resume", "", "Allow runs again (remove stop flag)");
    std::cout << theme::usage("backset init", "[file]", "Write a starter config");
    std::cout << "\n";
    std::cout << theme::dim(std::string("    Without --config, ") + DEFAULT_CONFIG_NAME +
                            " next to the executable is used.") << "\n";
    std::cout << theme::usage("backset --version", "", "Show version");
    std::cout << theme::usage("backset --help", "", "Show this help");
    std::cout << "\n";
}

int main(int argc, char** argv) {
    try {
        std::filesystem::path config_path = get_default_config_path();
        std::vector<std::string> positional;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--version") {
                std::cout << "backset version " << BACKSET_VERSION << "\n";
                return 0;
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return 0;
            } else if (arg == "--config" || arg == "-c") {
                if (i + 1 >= argc) {
                    std::cout << theme::fail("--config needs a file argument");
                    return 1;
                }
                config_path = argv[++i];
            } else {
                positional.push_back(arg);
            }
        }

        std::string cmd = positional.empty() ? "run" : positional[0];
        BacksetCLI cli(config_path);

        if (cmd == "run") {
            return cli.run_backup();
        } else if (cmd == "status") {
            return cli.run_status();
        } else if (cmd == "stop") {
            return cli.run_stop();
        } else if (cmd == "resume") {
            return cli.run_resume();
        } else if (cmd == "init") {
            return BacksetCLI::run_init(positional.size() >= 2 ? std::filesystem::path(positional[1]) : config_path);
        }

        std::cout << theme::fail("Unknown command: " + cmd);
        print_usage();
        return 1;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}

#include <iostream>
#include <vector>
#include <string>
#include "cli/tunneld_cli.hpp"
#include "cli/theme.hpp"

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    tunneld"
              << theme::color::RESET << theme::color::DIM
              << "                    Start tunnels and enter REPL" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    tunneld repl"
              << theme::color::RESET << theme::color::DIM
              << "               Start tunnels and enter REPL" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    tunneld run"
              << theme::color::RESET << theme::color::DIM
              << "                Run headless until SIGINT/SIGTERM" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    tunneld "
              << theme::color::RESET << theme::color::TEAL << "--config <path>"
              << theme::color::RESET << theme::color::DIM
              << "    Use another config file" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    tunneld --version          Show version\n"
              << "    tunneld --help             Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        std::string config_path;
        std::vector<std::string> args;
        for (int i = 1; i < argc; i++) {
            std::string a = argv[i];
            if (a == "--config") {
                if (i + 1 >= argc) {
                    std::cout << theme::fail("--config needs a path.");
                    return 1;
                }
                config_path = argv[++i];
            } else {
                args.push_back(a);
            }
        }

        std::string cmd = args.empty() ? "repl" : args[0];

        if (cmd == "--version") {
            std::cout << theme::color::TEAL << theme::color::BOLD << "tunneld"
                      << theme::color::RESET << theme::color::DIM
                      << " version 0.1.0" << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help") {
            print_usage();
            return 0;
        } else if (cmd != "repl" && cmd != "run") {
            std::cout << theme::fail("Unknown command: " + cmd);
            print_usage();
            return 1;
        }

        TunneldCLI cli;
        if (!cli.init(config_path)) return 1;

        if (cmd == "run") return cli.run_headless();
        cli.run_repl();
        return 0;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}

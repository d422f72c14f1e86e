#include <iostream>
#include <string>
#include "cli/ferry_cli.hpp"
#include "cli/theme.hpp"
#include <core/constants.hpp>
#include <platform/http.hpp>
#include <ssh/session.hpp>

void print_usage(const FerryCLI& cli) {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::TEAL << "    ferry run "
              << theme::color::RESET << theme::color::SAND << "<manifest_dir>"
              << theme::color::RESET << theme::color::DIM
              << "    Process every *.json manifest" << theme::color::RESET << "\n";
    cli.print_help();
    std::cout << theme::color::DIM
              << "    ferry --version        Show version\n"
              << "    ferry --help           Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        FerryCLI cli;

        if (argc >= 2) {
            std::string cmd = argv[1];
            if (cmd == "--version") {
                std::cout << theme::color::TEAL << theme::color::BOLD << "ferry"
                          << theme::color::RESET << theme::color::DIM
                          << " version " << FERRY_VERSION << theme::color::RESET << "\n";
                return 0;
            }
            if (cmd == "--help" || cmd == "help") {
                print_usage(cli);
                return 0;
            }
        } else {
            print_usage(cli);
            return 1;
        }

        init_ssh_library();
        platform::init_http();
        int code = cli.run(argc, argv);
        platform::shutdown_http();
        shutdown_ssh_library();
        return code;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}

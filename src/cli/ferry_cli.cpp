#include "ferry_cli.hpp"
#include "theme.hpp"
#include <core/utils.hpp>
#include <iostream>

FerryCLI::FerryCLI() {
    register_pipeline_commands(*this);
    register_state_commands(*this);
}

bool FerryCLI::parse_options(std::vector<std::string>& args) {
    std::vector<std::string> rest;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        bool takes_value = a == "--config" || a == "--mode" || a == "--workers";
        if (!takes_value) {
            rest.push_back(a);
            continue;
        }
        if (i + 1 >= args.size()) {
            std::cout << theme::fail(a + " needs a value");
            return false;
        }
        const std::string& value = args[++i];

        if (a == "--config") {
            config_path = value;
        } else if (a == "--mode") {
            mode_override = parse_run_mode(value);
            if (!mode_override) {
                std::cout << theme::fail("Unknown mode: " + value);
                std::cout << theme::step("Modes: streaming, optimized, parallel");
                return false;
            }
        } else {
            workers_override = safe_stoi(value, 0);
            if (workers_override <= 0) {
                std::cout << theme::fail("--workers must be a positive number");
                return false;
            }
        }
    }
    args.swap(rest);
    return true;
}

int FerryCLI::run(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (!parse_options(args)) return 1;
    if (args.empty()) {
        print_help();
        return 1;
    }

    std::string cmd = args.front();
    args.erase(args.begin());
    return execute_command(cmd, args);
}

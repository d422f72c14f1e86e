#include "base_cli.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <iostream>
#include <fmt/format.h>

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::require_config() {
    if (config.has_value()) return true;

    auto loaded = config_path.empty() ? Config::load_global() : Config::load(config_path);
    if (loaded.is_err()) {
        std::cout << theme::fail(loaded.error);
        return false;
    }
    config = loaded.value;
    if (mode_override) config->set_mode(*mode_override);
    if (workers_override > 0) config->set_max_workers(workers_override);
    if (!config->log_file().empty()) set_ferry_log_path(config->log_file());

    state_store = std::make_unique<StateStore>(config->state_file());
    if (!state_store->load_warning().empty()) {
        std::cout << theme::warn(state_store->load_warning());
    }
    return true;
}

int BaseCLI::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Run 'ferry --help' for available commands.");
        return 1;
    }

    try {
        return it->second.first(*this, args);
    } catch (const std::exception& e) {
        ferry_log(std::string("[cli] ") + command + ": " + e.what());
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}

void BaseCLI::print_help() const {
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Pipeline", {"run"}},
        {"State",    {"status", "reset-failed", "reset"}},
        {"Setup",    {"init"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        std::cout << "\n" << theme::color::SAND << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::TEAL
                          << fmt::format("    {:<14}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n" << theme::color::DIM
              << "    Options: --config PATH, --mode streaming|optimized|parallel, --workers N"
              << theme::color::RESET << "\n\n";
}

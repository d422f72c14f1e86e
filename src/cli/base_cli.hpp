#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <vector>
#include <core/config.hpp>
#include <managers/state_store.hpp>

class BaseCLI {
public:
    BaseCLI() = default;
    virtual ~BaseCLI() = default;

    // Returns the process exit code
    using CommandHandler = std::function<int(BaseCLI&, const std::vector<std::string>&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    // Loads the config (from --config or ~/.ferry) and opens the state store
    bool require_config();

    int execute_command(const std::string& command, const std::vector<std::string>& args);
    void print_help() const;

    // Global options
    std::string config_path;
    std::optional<RunMode> mode_override;
    int workers_override = 0;

    std::optional<Config> config;
    std::unique_ptr<StateStore> state_store;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};

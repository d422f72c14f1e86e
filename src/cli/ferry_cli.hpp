#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>

// Command registration, one file per area under commands/
void register_pipeline_commands(BaseCLI& cli);
void register_state_commands(BaseCLI& cli);

class FerryCLI : public BaseCLI {
public:
    FerryCLI();

    // Parse global options out of argv and dispatch. Returns the exit code.
    int run(int argc, char** argv);

private:
    // Removes recognized options from args; false on a malformed option.
    bool parse_options(std::vector<std::string>& args);
};

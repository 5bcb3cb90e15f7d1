#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>

// Forward declarations for command registration
void register_setup_commands(BaseCLI& cli);
void register_log_commands(BaseCLI& cli);
void register_run_commands(BaseCLI& cli);

class RallyCLI : public BaseCLI {
public:
    RallyCLI();

    // Dispatch argv[1..]. Returns the process exit code.
    int run(const std::vector<std::string>& argv);

    void print_usage() const;

private:
    void register_all_commands();
};

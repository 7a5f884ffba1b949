#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>

// Forward declarations for command registration
void register_plan_commands(BaseCLI& cli);
void register_setup_commands(BaseCLI& cli);

class PlanlogCLI : public BaseCLI {
public:
    PlanlogCLI();

    // argv[1..] → command + space-joined arguments. Returns the exit code.
    int run(const std::vector<std::string>& args);

private:
    void register_all_commands();
};

#include "planlog_cli.hpp"
#include "theme.hpp"
#include <iostream>

PlanlogCLI::PlanlogCLI() : BaseCLI() {
    register_all_commands();
}

void PlanlogCLI::register_all_commands() {
    add_command("help", [this](BaseCLI& cli, const std::string& arg) {
        this->print_help();
        return 0;
    }, "Show this help message");

    register_plan_commands(*this);
    register_setup_commands(*this);
}

int PlanlogCLI::run(const std::vector<std::string>& args) {
    if (args.empty()) {
        print_help();
        return 1;
    }

    std::string rest;
    for (size_t i = 1; i < args.size(); ++i) {
        if (!rest.empty()) rest += " ";
        rest += args[i];
    }
    return execute_command(args[0], rest);
}

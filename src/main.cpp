#include <iostream>
#include <vector>
#include <string>
#include "cli/planlog_cli.hpp"
#include "cli/theme.hpp"

void print_usage() {
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    planlog logs "
              << theme::color::RESET << theme::color::BROWN << "<plan-id>"
              << theme::color::RESET << theme::color::DIM
              << "           Stream a plan's log until it finishes" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    planlog show "
              << theme::color::RESET << theme::color::BROWN << "<plan-id>"
              << theme::color::RESET << theme::color::DIM
              << "           Show plan status" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    planlog json-output "
              << theme::color::RESET << theme::color::BROWN << "<plan-id>"
              << theme::color::RESET << theme::color::DIM
              << "    Print the JSON execution plan" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    planlog init"
              << theme::color::RESET << theme::color::DIM
              << "                     Write ~/.planlog/config.yaml" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    planlog --version        Show version\n"
              << "    planlog --help           Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        if (argc == 1) {
            print_usage();
            return 1;
        }

        std::string cmd = argv[1];
        if (cmd == "--version") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "planlog"
                      << theme::color::RESET << theme::color::DIM
                      << " version 0.1.0" << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help") {
            print_usage();
            return 0;
        }

        PlanlogCLI cli;
        std::vector<std::string> args(argv + 1, argv + argc);
        return cli.run(args);
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string(e.what()));
        return 1;
    }
}

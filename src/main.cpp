#include <iostream>
#include <vector>
#include <string>
#include "cli/ec2ctl_cli.hpp"
#include "cli/theme.hpp"

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    ec2ctl"
              << theme::color::RESET << theme::color::DIM
              << "                     Start an interactive session" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    ec2ctl setup"
              << theme::color::RESET << theme::color::DIM
              << "               Write ~/.ec2ctl/config.yaml" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    ec2ctl list "
              << theme::color::RESET << theme::color::BROWN << "[region] [state]"
              << theme::color::RESET << theme::color::DIM
              << "  Refresh once and print" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    ec2ctl --version           Show version\n"
              << "    ec2ctl --help              Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        if (argc == 1) {
            Ec2ctlCLI cli;
            cli.run_repl();
            return 0;
        }

        std::string cmd = argv[1];

        if (cmd == "--version") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "ec2ctl"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << EC2CTL_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help") {
            print_usage();
            return 0;
        }

        Ec2ctlCLI cli;
        if (cmd == "setup") {
            cli.run_setup();
        } else if (cmd == "list") {
            return cli.run_list(std::vector<std::string>(argv + 2, argv + argc));
        } else {
            std::cout << theme::fail("Unknown command: " + cmd);
            print_usage();
            return 1;
        }

        return 0;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}

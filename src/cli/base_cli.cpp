#include "base_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <sstream>
#include <fmt/format.h>

BaseCLI::BaseCLI() {
    fleet = std::make_unique<FleetService>();
}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::require_fleet() {
    if (!fleet || !fleet->is_initialized()) {
        std::cout << theme::fail("Not initialized. Run 'ec2ctl' to start a session.");
        return false;
    }
    return true;
}

void BaseCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'help' for available commands.");
        return;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
    }
}

void BaseCLI::print_help() const {
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Fleet",     {"list", "sort", "status", "regions", "enable", "disable"}},
        {"Refresh",   {"refresh", "auto"}},
        {"Instances", {"start", "stop", "reboot", "pin", "unpin"}},
        {"General",   {"help", "clear", "quit", "exit"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        bool has_any = false;
        for (const auto& name : cmd_names) {
            if (commands_.count(name)) {
                has_any = true;
                break;
            }
        }
        if (!has_any) continue;

        std::cout << "\n" << theme::color::BROWN << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::BLUE
                          << fmt::format("    {:<14}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n";
}

std::string BaseCLI::get_prompt_string() const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    std::string prompt = rl_esc(theme::color::BROWN) + "ec2ctl" + rl_esc(theme::color::RESET);
    if (fleet && fleet->is_initialized()) {
        const auto& profile = fleet->config().aws().profile;
        prompt += ":" + rl_esc(theme::color::BLUE) + (profile.empty() ? "default" : profile)
                + rl_esc(theme::color::RESET);
        if (fleet->scheduler_state() == SchedulerState::Paused) {
            prompt += rl_esc(theme::color::DIM) + " (paused)" + rl_esc(theme::color::RESET);
        }
    }
    return prompt + "> ";
}

std::vector<std::string> split_args(const std::string& args) {
    std::vector<std::string> out;
    std::istringstream iss(args);
    std::string word;
    while (iss >> word) out.push_back(word);
    return out;
}

#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <managers/fleet_service.hpp>

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    bool require_fleet();

    void execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    // Public state
    std::unique_ptr<FleetService> fleet;
    CacheFilter view;                   // sort order kept between 'list' calls

    // Returns the prompt string for readline
    std::string get_prompt_string() const;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};

// Split a command argument string on whitespace.
std::vector<std::string> split_args(const std::string& args);

#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>

// Both forms are accepted: "<region> <id>" and "<id>" when the id is unique.
static bool resolve_target(BaseCLI& cli, const std::string& arg, const std::string& usage,
                           std::string& region, std::string& id) {
    auto args = split_args(arg);
    if (args.size() == 2) {
        region = args[0];
        id = args[1];
        return true;
    }
    if (args.size() == 1) {
        std::vector<Instance> matches;
        for (auto& inst : cli.fleet->read()) {
            if (inst.id == args[0]) matches.push_back(inst);
        }
        if (matches.size() == 1) {
            region = matches[0].region;
            id = matches[0].id;
            return true;
        }
        if (matches.size() > 1) {
            std::cout << theme::fail(args[0] + " exists in several regions; give the region too.");
            return false;
        }
    }
    std::cout << theme::fail("Usage: " + usage);
    return false;
}

static void do_action(BaseCLI& cli, const std::string& arg, InstanceAction action) {
    if (!cli.require_fleet()) return;

    std::string verb = action_name(action);
    std::string region, id;
    if (!resolve_target(cli, arg, verb + " [region] <instance-id>", region, id)) return;

    auto result = cli.fleet->request_action(region, id, action);
    if (result.is_err()) {
        switch (result.kind) {
            case ErrorKind::Rejected:
                std::cout << theme::fail(fmt::format("Cannot {} {}: {}", verb, id, result.error));
                break;
            case ErrorKind::Auth:
                std::cout << theme::fail("Credentials rejected: " + result.error);
                std::cout << theme::step("Check your AWS profile, then 'auto on' to resume.");
                break;
            default:
                std::cout << theme::fail(fmt::format("{} {} failed: {}", verb, id, result.error));
                break;
        }
        return;
    }
    std::cout << theme::ok(fmt::format("{} requested for {} ({})", verb, id, region));
}

static void do_pin(BaseCLI& cli, const std::string& arg, bool pinned) {
    if (!cli.require_fleet()) return;

    std::string region, id;
    if (!resolve_target(cli, arg, std::string(pinned ? "pin" : "unpin") + " [region] <instance-id>",
                        region, id)) return;

    auto result = cli.fleet->set_pinned(region, id, pinned);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return;
    }
    std::cout << theme::ok(fmt::format("{} {}", pinned ? "Pinned" : "Unpinned", id));
}

void register_instance_commands(BaseCLI& cli) {
    cli.add_command("start", [](BaseCLI& c, const std::string& a) {
        do_action(c, a, InstanceAction::Start);
    }, "Start a stopped instance");
    cli.add_command("stop", [](BaseCLI& c, const std::string& a) {
        do_action(c, a, InstanceAction::Stop);
    }, "Stop a running instance");
    cli.add_command("reboot", [](BaseCLI& c, const std::string& a) {
        do_action(c, a, InstanceAction::Reboot);
    }, "Reboot a running instance");
    cli.add_command("pin", [](BaseCLI& c, const std::string& a) { do_pin(c, a, true); },
                    "Keep an instance at the top of lists");
    cli.add_command("unpin", [](BaseCLI& c, const std::string& a) { do_pin(c, a, false); },
                    "Remove a pin");
}

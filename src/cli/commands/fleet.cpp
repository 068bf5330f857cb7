#include "../base_cli.hpp"
#include "../instance_table.hpp"
#include "../theme.hpp"
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <iostream>
#include <fmt/format.h>

// ── Helpers ──────────────────────────────────────────────────

static bool looks_like_state(const std::string& word) {
    return parse_state(word) != InstanceState::Unknown || word == "unknown";
}

static void print_scan_report(const ScanReport& report) {
    if (report.aborted) {
        std::cout << theme::fail("Refresh failed: " + report.abort_error);
        return;
    }
    for (const auto& r : report.regions) {
        if (!r.ok) {
            std::cout << theme::warn(fmt::format("{} unavailable: {}", r.region, r.error));
        }
    }
    std::cout << theme::ok(fmt::format("Refreshed {} regions in {}ms ({} failed)",
                                       report.regions.size(), report.duration.count(),
                                       report.failed()));
}

// ── Commands ─────────────────────────────────────────────────

static void do_list(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_fleet()) return;

    CacheFilter filter = cli.view;
    for (const auto& word : split_args(arg)) {
        if (looks_like_state(word)) {
            filter.state = parse_state(word);
        } else {
            filter.region = word;
        }
    }

    auto rows = cli.fleet->list_instances(filter);
    std::cout << render_instance_table(rows);
    if (filter.region && cli.fleet->is_stale(*filter.region)) {
        std::cout << theme::warn(*filter.region + " data is stale");
    }
}

static void do_sort(BaseCLI& cli, const std::string& arg) {
    auto args = split_args(arg);
    if (args.empty()) {
        std::cout << theme::fail("Usage: sort <region|name|id|state|type|public_ip|private_ip|off> [desc]");
        return;
    }
    if (args[0] == "off") {
        cli.view.sort.reset();
        cli.view.descending = false;
        std::cout << theme::ok("Sorting off (first-seen order)");
        return;
    }
    auto key = parse_sort_key(args[0]);
    if (!key) {
        std::cout << theme::fail("Unknown sort key: " + args[0]);
        return;
    }
    cli.view.sort = key;
    cli.view.descending = args.size() > 1 && to_lower(args[1]) == "desc";
    std::cout << theme::ok(fmt::format("Sorting by {} ({})", args[0],
                                       cli.view.descending ? "descending" : "ascending"));
}

static void do_status(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_fleet()) return;
    auto& fleet = *cli.fleet;

    auto instances = fleet.read();
    size_t pinned = 0, pending = 0;
    for (const auto& i : instances) {
        if (i.pinned) ++pinned;
        if (i.optimistic) ++pending;
    }

    std::cout << theme::section("Status");
    std::cout << theme::kv("Profile", fleet.config().aws().profile.empty()
                                          ? "default" : fleet.config().aws().profile);
    std::cout << theme::kv("Refresh", fmt::format("{} (every {}s)",
                                                  scheduler_state_name(fleet.scheduler_state()),
                                                  fleet.config().refresh().interval_secs));
    std::string halt = fleet.halt_reason();
    if (!halt.empty()) {
        std::cout << theme::kv("Halted", theme::red(halt));
    }
    std::cout << theme::kv("Instances", fmt::format("{} ({} pinned, {} pending)",
                                                    instances.size(), pinned, pending));

    int stale = 0;
    for (const auto& r : fleet.region_status()) {
        if (r.stale) ++stale;
    }
    std::cout << theme::kv("Stale", fmt::format("{} regions", stale));
    std::cout << "\n";
}

static void do_regions(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_fleet()) return;
    auto listed = cli.fleet->regions();
    if (listed.is_err()) {
        std::cout << theme::fail(listed.error);
        return;
    }
    std::cout << render_region_table(listed.value, cli.fleet->region_status());
}

static void set_region(BaseCLI& cli, const std::string& arg, bool enabled) {
    if (!cli.require_fleet()) return;
    if (arg.empty()) {
        std::cout << theme::fail(fmt::format("Usage: {} <region>", enabled ? "enable" : "disable"));
        return;
    }
    auto result = cli.fleet->set_region_enabled(arg, enabled);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return;
    }
    std::cout << theme::ok(fmt::format("{} {}", arg, enabled ? "enabled" : "disabled"));
}

static void do_refresh(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_fleet()) return;
    std::cout << theme::dim("    Refreshing...") << "\n";
    auto report = cli.fleet->manual_refresh().get();
    print_scan_report(report);
}

static void do_auto(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_fleet()) return;
    std::string mode = to_lower(arg);
    if (mode == "on") {
        cli.fleet->set_auto_refresh(true);
        std::cout << theme::ok(fmt::format("Auto refresh on (every {}s)",
                                           cli.fleet->config().refresh().interval_secs));
    } else if (mode == "off") {
        cli.fleet->set_auto_refresh(false);
        std::cout << theme::ok("Auto refresh paused");
    } else {
        std::cout << theme::fail("Usage: auto on|off");
    }
}

void register_fleet_commands(BaseCLI& cli) {
    cli.add_command("list", do_list, "List instances [region] [state]");
    cli.add_command("sort", do_sort, "Sort unpinned rows <key> [desc]");
    cli.add_command("status", do_status, "Show refresh and cache status");
    cli.add_command("regions", do_regions, "List regions and their freshness");
    cli.add_command("enable", [](BaseCLI& c, const std::string& a) { set_region(c, a, true); },
                    "Include a region in refreshes");
    cli.add_command("disable", [](BaseCLI& c, const std::string& a) { set_region(c, a, false); },
                    "Exclude a region from refreshes");
    cli.add_command("refresh", do_refresh, "Refresh all enabled regions now");
    cli.add_command("auto", do_auto, "Toggle periodic refresh (on|off)");
}

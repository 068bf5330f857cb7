#include "instance_table.hpp"
#include "theme.hpp"
#include <core/time_utils.hpp>
#include <fmt/format.h>
#include <map>

std::string render_instance_table(const std::vector<InstanceSummary>& rows) {
    if (rows.empty()) {
        return theme::dim("  No instances found.") + "\n";
    }

    std::string out = "\n";
    out += theme::color::DIM
        + fmt::format("  {:<2}{:<16}{:<22}{:<24}{:<15}{:<13}{:<16}{:<16}{}",
                      "", "REGION", "ID", "NAME", "STATE", "TYPE", "PUBLIC IP", "PRIVATE IP", "AGE")
        + theme::color::RESET + "\n";

    for (const auto& r : rows) {
        std::string marker = r.pinned ? theme::brown("* ") : "  ";
        std::string name = r.name.size() > 22 ? r.name.substr(0, 21) + "~" : r.name;
        std::string age = r.stale ? theme::yellow(r.age + " stale") : theme::dim(r.age);

        out += "  " + marker
            + fmt::format("{:<16}{:<22}{:<24}", r.region, r.id, name)
            + theme::state(r.state, 15)
            + fmt::format("{:<13}{:<16}{:<16}", r.type, r.public_ip, r.private_ip)
            + age + "\n";
    }
    out += "\n";
    return out;
}

std::string render_region_table(const std::vector<Region>& regions,
                                const std::vector<RegionStatus>& status) {
    std::map<std::string, RegionStatus> by_code;
    for (const auto& s : status) by_code[s.code] = s;

    std::string out = "\n";
    out += theme::color::DIM
        + fmt::format("  {:<16}{:<28}{:<10}{:<11}{:<10}{}",
                      "REGION", "NAME", "ENABLED", "INSTANCES", "UPDATED", "STATUS")
        + theme::color::RESET + "\n";

    auto now = std::chrono::system_clock::now();
    for (const auto& r : regions) {
        auto it = by_code.find(r.code);
        size_t count = 0;
        std::string updated = "-";
        std::string health = theme::dim("never fetched");
        if (it != by_code.end()) {
            const auto& s = it->second;
            count = s.instance_count;
            updated = format_snapshot_age(s.as_of, now);
            if (s.last_fetch_failed) {
                health = theme::red("failed: " + s.last_error);
            } else if (s.stale) {
                health = theme::yellow("stale");
            } else {
                health = theme::green("fresh");
            }
        }
        out += fmt::format("  {:<16}{:<28}", r.code, r.display_name)
            + (r.enabled ? theme::green(fmt::format("{:<10}", "yes")) : theme::dim(fmt::format("{:<10}", "no")))
            + fmt::format("{:<11}{:<10}", count, updated)
            + health + "\n";
    }
    out += "\n";
    return out;
}

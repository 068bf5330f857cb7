#include "instance_fetcher.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <set>

using std::chrono::milliseconds;
using std::chrono::steady_clock;

InstanceFetcher::InstanceFetcher(ComputeApi& api, int timeout_secs)
    : api_(api), budget_(std::chrono::seconds(timeout_secs < 1 ? 1 : timeout_secs)) {}

Result<RegionSnapshot> InstanceFetcher::fetch_instances(const std::string& region,
                                                        const std::vector<std::string>& health_ids) {
    auto deadline = steady_clock::now() + budget_;

    RegionSnapshot snap;
    snap.region = region;

    std::string token;
    std::set<std::string> tokens_seen;
    int pages = 0;

    do {
        auto remaining = std::chrono::duration_cast<milliseconds>(deadline - steady_clock::now());
        if (remaining.count() <= 0) {
            return Result<RegionSnapshot>::Err(ErrorKind::RegionUnavailable,
                fmt::format("{}: timed out after {}ms ({} page(s) read)",
                            region, budget_.count(), pages));
        }

        auto page = api_.describe_instances(region, token, remaining);
        if (page.is_err()) {
            ErrorKind kind = page.kind == ErrorKind::Auth ? ErrorKind::Auth
                                                          : ErrorKind::RegionUnavailable;
            return Result<RegionSnapshot>::Err(kind,
                fmt::format("{}: {} ({})", region, page.error, error_kind_name(page.kind)));
        }

        for (auto& inst : page.value.instances) {
            inst.region = region;
            if (inst.name.empty()) inst.name = inst.id;
            snap.instances.push_back(std::move(inst));
        }
        pages++;

        token = page.value.next_token;
        if (!token.empty() && !tokens_seen.insert(token).second) {
            return Result<RegionSnapshot>::Err(ErrorKind::RegionUnavailable,
                fmt::format("{}: pagination token repeated", region));
        }
    } while (!token.empty());

    snap.as_of = std::chrono::system_clock::now();

    auto health = fetch_health(snap, health_ids, deadline);
    if (health.is_err()) {
        return Result<RegionSnapshot>::Err(ErrorKind::Auth,
            fmt::format("{}: {} ({})", region, health.error, error_kind_name(health.kind)));
    }

    ec2ctl_log(fmt::format("fetch: {} -> {} instance(s) in {} page(s), {} status check(s)",
                           region, snap.instances.size(), pages, snap.health.size()));
    return Result<RegionSnapshot>::Ok(snap);
}

Result<void> InstanceFetcher::fetch_health(RegionSnapshot& snap, const std::vector<std::string>& ids,
                                           steady_clock::time_point deadline) {
    for (const auto& id : ids) {
        auto remaining = std::chrono::duration_cast<milliseconds>(deadline - steady_clock::now());
        if (remaining.count() <= 0) {
            ec2ctl_log(fmt::format("fetch: {} no budget left for status of {}", snap.region, id));
            break;
        }

        auto status = api_.describe_instance_status(snap.region, id, remaining);
        if (status.is_err()) {
            if (status.kind == ErrorKind::Auth) return Result<void>::Err(status);
            // The listing is still good; the overlay just waits another tick
            ec2ctl_log(fmt::format("fetch: {} status of {} failed: {}", snap.region, id, status.error));
            continue;
        }
        snap.health[id] = status.value;
    }
    return Result<void>::Ok();
}

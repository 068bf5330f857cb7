#include "region_catalog.hpp"
#include <cloud/aws_json.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>

RegionCatalog::RegionCatalog(ComputeApi& api, std::vector<std::string> allow, int timeout_secs)
    : api_(api), allow_(std::move(allow)), timeout_secs_(timeout_secs) {}

Result<std::vector<Region>> RegionCatalog::list_regions() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (regions_) return Result<std::vector<Region>>::Ok(*regions_);
    }

    // Remote call outside the lock; concurrent first callers may both list,
    // the first to finish wins.
    auto codes = api_.list_regions(std::chrono::seconds(timeout_secs_));
    if (codes.is_err()) {
        ErrorKind kind = codes.kind == ErrorKind::Auth ? ErrorKind::Auth : ErrorKind::Network;
        ec2ctl_log(fmt::format("catalog: listing failed ({}): {}", error_kind_name(codes.kind), codes.error));
        return Result<std::vector<Region>>::Err(kind, "Failed to list regions: " + codes.error);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (regions_) return Result<std::vector<Region>>::Ok(*regions_);

    std::vector<Region> listed;
    for (const auto& code : codes.value) {
        Region r;
        r.code = code;
        r.display_name = region_display_name(code);
        r.enabled = allow_.empty() ||
                    std::find(allow_.begin(), allow_.end(), code) != allow_.end();

        auto prev = std::find_if(previous_.begin(), previous_.end(),
                                 [&](const Region& p) { return p.code == code; });
        if (prev != previous_.end()) r.enabled = prev->enabled;

        listed.push_back(r);
    }
    regions_ = listed;
    ec2ctl_log(fmt::format("catalog: {} region(s) listed", listed.size()));
    return Result<std::vector<Region>>::Ok(listed);
}

void RegionCatalog::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (regions_) previous_ = *regions_;
    regions_.reset();
}

bool RegionCatalog::set_enabled(const std::string& code, bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!regions_) return false;
    for (auto& r : *regions_) {
        if (r.code == code) {
            r.enabled = enabled;
            return true;
        }
    }
    return false;
}

std::vector<Region> RegionCatalog::enabled_regions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Region> out;
    if (!regions_) return out;
    for (const auto& r : *regions_) {
        if (r.enabled) out.push_back(r);
    }
    return out;
}

std::vector<Region> RegionCatalog::cached() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return regions_ ? *regions_ : std::vector<Region>{};
}

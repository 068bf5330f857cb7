#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <core/types.hpp>
#include <cloud/compute_api.hpp>

// Fetches the complete instance set of one region. All pages share one
// time budget; any failure surfaces as RegionUnavailable, except credential
// failures which keep the Auth kind.
class InstanceFetcher {
public:
    InstanceFetcher(ComputeApi& api, int timeout_secs = FETCH_TIMEOUT_SECS);

    // `health_ids` are instances with a reboot in flight; their status checks
    // are read after the listing, from whatever budget the pages left over.
    Result<RegionSnapshot> fetch_instances(const std::string& region,
                                           const std::vector<std::string>& health_ids = {});

private:
    ComputeApi& api_;
    std::chrono::milliseconds budget_;

    // Fails only on credential errors; other failures skip that id.
    Result<void> fetch_health(RegionSnapshot& snap, const std::vector<std::string>& ids,
                              std::chrono::steady_clock::time_point deadline);
};

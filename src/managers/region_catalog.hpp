#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <optional>
#include <core/types.hpp>
#include <cloud/compute_api.hpp>

// Session-wide list of regions. The first list_regions() performs the remote
// listing; later calls return the cached list until invalidate().
class RegionCatalog {
public:
    // `allow` names the regions enabled initially; empty enables all.
    RegionCatalog(ComputeApi& api, std::vector<std::string> allow = {},
                  int timeout_secs = CATALOG_TIMEOUT_SECS);

    // Fails with Auth or Network kinds; a failure does not drop a list that
    // is already cached from an earlier call in this session.
    Result<std::vector<Region>> list_regions();

    // Forget the cached listing; the next list_regions() goes remote again.
    // Enabled flags are carried over for regions that are listed again.
    void invalidate();

    bool set_enabled(const std::string& code, bool enabled);

    // Cached regions with enabled set (empty if never listed).
    std::vector<Region> enabled_regions() const;

    // Cached list without a remote call (empty if never listed).
    std::vector<Region> cached() const;

private:
    ComputeApi& api_;
    std::vector<std::string> allow_;
    int timeout_secs_;

    mutable std::mutex mutex_;
    std::optional<std::vector<Region>> regions_;
    std::vector<Region> previous_;      // kept across invalidate() for enabled flags
};

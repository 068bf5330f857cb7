#pragma once

#include <string>
#include <vector>
#include <map>
#include <set>
#include <mutex>
#include <optional>
#include <chrono>
#include <cstdint>
#include <core/types.hpp>
#include <cloud/instance.hpp>
#include "change_feed.hpp"
#include "reconciler.hpp"

enum class SortKey {
    Region,
    Name,
    Id,
    State,
    Type,
    PublicIp,
    PrivateIp,
};

std::optional<SortKey> parse_sort_key(const std::string& name);

struct CacheFilter {
    std::optional<std::string> region;
    std::optional<InstanceState> state;     // matches the confirmed state
    std::optional<SortKey> sort;            // applied to the unpinned group only
    bool descending = false;
};

struct RegionStatus {
    std::string code;
    size_t instance_count = 0;
    std::chrono::system_clock::time_point as_of{};
    bool stale = true;
    bool last_fetch_failed = false;
    std::string last_error;
};

// In-memory instance state per region. One mutex serializes every write
// (optimistic overlays, merges, pins) and every read, so readers always see
// whole merges. Nothing here touches the network.
class StateCache {
public:
    StateCache(ChangeFeed& feed, int stale_ttl_secs, int eviction_misses);

    // ── Queries ──────────────────────────────────────────────

    // Pinned instances first, each group in first-seen order unless a sort
    // key is given (the sort then reorders the unpinned group, stably).
    std::vector<Instance> read(const CacheFilter& filter = {}) const;

    std::optional<Instance> find(const std::string& region, const std::string& id) const;

    bool is_stale(const std::string& region) const;
    bool is_stale(const std::string& region, std::chrono::system_clock::time_point now) const;

    std::vector<RegionStatus> regions() const;
    std::vector<RegionStatus> regions(std::chrono::system_clock::time_point now) const;

    // Instances of `region` with a reboot overlay outstanding.
    std::vector<std::string> rebooting_ids(const std::string& region) const;

    // ── Writers ──────────────────────────────────────────────

    // Install or replace the overlay of one instance, stamped with the
    // current tick. Returns false (and changes nothing) for unknown instances.
    bool apply_optimistic(const std::string& region, const std::string& id,
                          InstanceAction action, InstanceState target_state,
                          int expires_after_ticks, int health_wait_ticks = 0);

    // The only path that changes confirmed state, lastConfirmed, or evicts.
    MergeStats merge_confirmed(const RegionSnapshot& fresh);

    // Record a failed fetch: cached data kept, region marked stale.
    void mark_fetch_failed(const std::string& region, const std::string& reason);

    // Local-only pin flag. Pins are remembered by key, so an instance that is
    // evicted and later reappears comes back pinned.
    bool set_pinned(const std::string& region, const std::string& id, bool pinned);
    std::set<InstanceKey> pinned_keys() const;

    // Seed the cache from a persisted snapshot. Restored regions count as
    // stale until their first successful merge.
    void restore(const std::vector<Instance>& instances,
                 std::chrono::system_clock::time_point as_of,
                 const std::set<InstanceKey>& pinned);

    // Scheduler tick counter used for overlay expiry.
    uint64_t advance_tick();
    uint64_t current_tick() const;

    ChangeFeed& feed() { return feed_; }

private:
    ChangeFeed& feed_;
    Reconciler reconciler_;
    std::chrono::seconds stale_ttl_;

    mutable std::mutex mutex_;
    std::map<std::string, RegionEntry> regions_;
    std::vector<std::string> region_order_;     // first-seen order of regions
    std::set<InstanceKey> pinned_;
    uint64_t tick_ = 0;
    uint64_t next_order_ = 1;

    RegionEntry& entry_unlocked(const std::string& region);
    Instance* find_unlocked(const std::string& region, const std::string& id);
    bool is_stale_unlocked(const RegionEntry& entry, std::chrono::system_clock::time_point now) const;
};

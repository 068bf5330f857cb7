#pragma once

#include <string>
#include <vector>
#include <set>
#include <chrono>
#include <cstdint>
#include <cloud/instance.hpp>
#include "change_feed.hpp"

// Cached state of one region. Instances keep first-seen order.
struct RegionEntry {
    std::string region;
    std::vector<Instance> instances;
    std::chrono::system_clock::time_point as_of{};
    bool confirmed = false;         // at least one successful merge this session
    bool last_fetch_failed = false;
    std::string last_error;
};

struct MergeStats {
    bool ignored = false;           // snapshot older than the cached one
    int added = 0;
    int updated = 0;
    int evicted = 0;
    int overlays_confirmed = 0;
    int overlays_discarded = 0;
    int overlays_retained = 0;
};

enum class OverlayOutcome {
    Confirmed,      // remote reached the target (or a successor)
    Discarded,      // expired without corroboration
    Retained,       // still plausibly in flight
};

// Merges fresh per-region snapshots into a RegionEntry. Holds no state of
// its own beyond policy, so the caller decides locking; StateCache calls it
// under its writer lock.
class Reconciler {
public:
    explicit Reconciler(int eviction_misses);

    MergeStats merge(RegionEntry& entry,
                     const RegionSnapshot& fresh,
                     uint64_t current_tick,
                     uint64_t& next_order,
                     const std::set<InstanceKey>& pinned,
                     std::vector<CacheEvent>& events) const;

    // Conflict rule between an outstanding overlay and a confirmed state.
    // `health` is the instance's status checks when they were fetched.
    static OverlayOutcome resolve(const OptimisticOverlay& overlay,
                                  InstanceState fresh_state,
                                  uint64_t current_tick,
                                  const InstanceHealth* health = nullptr);

    // True if `fresh_state` is the overlay's target or a state the target
    // naturally moves on to (pending -> running, stopping -> stopped).
    // A reboot is corroborated only by passing status checks.
    static bool corroborates(const OptimisticOverlay& overlay, InstanceState fresh_state,
                             const InstanceHealth* health = nullptr);

private:
    int eviction_misses_;
};

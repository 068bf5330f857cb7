#include "reconciler.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <map>

Reconciler::Reconciler(int eviction_misses)
    : eviction_misses_(eviction_misses < 1 ? 1 : eviction_misses) {}

bool Reconciler::corroborates(const OptimisticOverlay& overlay, InstanceState fresh_state,
                              const InstanceHealth* health) {
    // A reboot leaves the state at running; only the status checks tell
    if (overlay.action == InstanceAction::Reboot) {
        return fresh_state == InstanceState::Running && health && health->ok();
    }

    if (fresh_state == overlay.target_state) return true;
    switch (overlay.target_state) {
        case InstanceState::Pending:  return fresh_state == InstanceState::Running;
        case InstanceState::Stopping: return fresh_state == InstanceState::Stopped;
        default:                      return false;
    }
}

OverlayOutcome Reconciler::resolve(const OptimisticOverlay& overlay,
                                   InstanceState fresh_state,
                                   uint64_t current_tick,
                                   const InstanceHealth* health) {
    if (corroborates(overlay, fresh_state, health)) return OverlayOutcome::Confirmed;
    if (!overlay.expired(current_tick)) return OverlayOutcome::Retained;

    // Checks still initializing after a reboot keep the hint up to its cap
    if (overlay.action == InstanceAction::Reboot && fresh_state == InstanceState::Running &&
        health && health->reported() && !overlay.health_wait_over(current_tick)) {
        return OverlayOutcome::Retained;
    }
    return OverlayOutcome::Discarded;
}

// Copy the remote-owned fields. Returns true if anything changed.
static bool adopt_confirmed(Instance& cached, const Instance& fresh) {
    bool changed = cached.state != fresh.state ||
                   cached.name != fresh.name ||
                   cached.instance_type != fresh.instance_type ||
                   cached.public_ip != fresh.public_ip ||
                   cached.private_ip != fresh.private_ip ||
                   cached.launch_time != fresh.launch_time;
    cached.state = fresh.state;
    cached.name = fresh.name;
    cached.instance_type = fresh.instance_type;
    cached.public_ip = fresh.public_ip;
    cached.private_ip = fresh.private_ip;
    cached.launch_time = fresh.launch_time;
    return changed;
}

MergeStats Reconciler::merge(RegionEntry& entry,
                             const RegionSnapshot& fresh,
                             uint64_t current_tick,
                             uint64_t& next_order,
                             const std::set<InstanceKey>& pinned,
                             std::vector<CacheEvent>& events) const {
    MergeStats stats;

    if (entry.confirmed && fresh.as_of < entry.as_of) {
        ec2ctl_log(fmt::format("reconcile: {} ignoring snapshot older than cached one", entry.region));
        stats.ignored = true;
        return stats;
    }

    // Replaying the snapshot already applied must not count misses again
    bool new_snapshot = !entry.confirmed || fresh.as_of > entry.as_of;

    std::map<std::string, size_t> index;
    for (size_t i = 0; i < entry.instances.size(); ++i) {
        index[entry.instances[i].id] = i;
    }

    std::set<std::string> seen;
    for (const auto& f : fresh.instances) {
        if (!seen.insert(f.id).second) continue;  // duplicate id in one snapshot

        auto it = index.find(f.id);
        if (it == index.end()) {
            Instance inst = f;
            inst.region = entry.region;
            inst.optimistic.reset();
            inst.pinned = pinned.count({entry.region, f.id}) > 0;
            inst.last_confirmed = fresh.as_of;
            inst.misses = 0;
            inst.stale = false;
            inst.order = next_order++;
            entry.instances.push_back(std::move(inst));
            index[f.id] = entry.instances.size() - 1;
            stats.added++;
            events.push_back({0, CacheEventKind::InstanceAdded, entry.region, f.id, state_name(f.state)});
            continue;
        }

        Instance& cached = entry.instances[it->second];

        if (cached.optimistic) {
            auto h = fresh.health.find(f.id);
            const InstanceHealth* health = h == fresh.health.end() ? nullptr : &h->second;
            switch (resolve(*cached.optimistic, f.state, current_tick, health)) {
                case OverlayOutcome::Confirmed:
                    stats.overlays_confirmed++;
                    events.push_back({0, CacheEventKind::OverlayConfirmed, entry.region, f.id,
                                      state_name(f.state)});
                    cached.optimistic.reset();
                    break;
                case OverlayOutcome::Discarded:
                    stats.overlays_discarded++;
                    events.push_back({0, CacheEventKind::OverlayDiscarded, entry.region, f.id,
                                      fmt::format("{} not observed, remote reports {}",
                                                  action_name(cached.optimistic->action),
                                                  state_name(f.state))});
                    ec2ctl_log(fmt::format("reconcile: {}/{} dropped {} overlay at tick {}",
                                           entry.region, f.id,
                                           action_name(cached.optimistic->action), current_tick));
                    cached.optimistic.reset();
                    break;
                case OverlayOutcome::Retained:
                    stats.overlays_retained++;
                    break;
            }
        }

        bool changed = adopt_confirmed(cached, f);
        bool was_stale = cached.stale;
        cached.last_confirmed = fresh.as_of;
        cached.misses = 0;
        cached.stale = false;
        if (changed || was_stale) {
            stats.updated++;
            events.push_back({0, CacheEventKind::InstanceUpdated, entry.region, f.id,
                              state_name(f.state)});
        }
    }

    // Instances absent from this snapshot
    std::vector<Instance> kept;
    kept.reserve(entry.instances.size());
    for (auto& inst : entry.instances) {
        if (seen.count(inst.id)) {
            kept.push_back(std::move(inst));
            continue;
        }

        if (new_snapshot) {
            inst.misses++;
            if (inst.misses >= eviction_misses_) {
                stats.evicted++;
                events.push_back({0, CacheEventKind::InstanceEvicted, entry.region, inst.id,
                                  fmt::format("absent from {} fetches", inst.misses)});
                continue;
            }
            if (!inst.stale) {
                events.push_back({0, CacheEventKind::InstanceUpdated, entry.region, inst.id, "stale"});
            }
            inst.stale = true;
            if (inst.optimistic && inst.optimistic->expired(current_tick)) {
                stats.overlays_discarded++;
                events.push_back({0, CacheEventKind::OverlayDiscarded, entry.region, inst.id,
                                  "instance missing from snapshot"});
                inst.optimistic.reset();
            }
        }
        kept.push_back(std::move(inst));
    }
    entry.instances = std::move(kept);

    entry.as_of = fresh.as_of;
    entry.confirmed = true;
    entry.last_fetch_failed = false;
    entry.last_error.clear();

    if (new_snapshot) {
        events.push_back({0, CacheEventKind::RegionRefreshed, entry.region, "",
                          fmt::format("{} instance(s)", entry.instances.size())});
    }
    return stats;
}

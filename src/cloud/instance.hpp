#pragma once

#include <string>
#include <vector>
#include <optional>
#include <map>
#include <chrono>
#include <cstdint>

// Remote lifecycle states. Unknown covers values the provider may add later.
enum class InstanceState {
    Pending,
    Running,
    Stopping,
    Stopped,
    ShuttingDown,
    Terminated,
    Unknown,
};

enum class InstanceAction {
    Start,
    Stop,
    Reboot,
};

const char* state_name(InstanceState state);
InstanceState parse_state(const std::string& name);

const char* action_name(InstanceAction action);

struct Region {
    std::string code;           // e.g. "eu-west-1"
    std::string display_name;   // e.g. "Europe (Ireland)"
    bool enabled = true;
};

// Local hint for a dispatched action that the remote has not yet confirmed.
struct OptimisticOverlay {
    InstanceAction action = InstanceAction::Start;
    InstanceState target_state = InstanceState::Pending;
    uint64_t issued_at_tick = 0;
    int expires_after_ticks = 2;
    int health_wait_ticks = 0;  // reboot only: cap while status checks are still running

    bool expired(uint64_t current_tick) const {
        return current_tick - issued_at_tick >= static_cast<uint64_t>(expires_after_ticks);
    }
    bool health_wait_over(uint64_t current_tick) const {
        return current_tick - issued_at_tick >= static_cast<uint64_t>(health_wait_ticks);
    }
};

// describe-instance-status view of one instance.
struct InstanceHealth {
    std::string instance_state = "unknown";
    std::string system_status = "unknown";     // ok, impaired, initializing, ...
    std::string instance_status = "unknown";

    // Both checks passed on a running instance
    bool ok() const {
        return instance_state == "running" && system_status == "ok" && instance_status == "ok";
    }
    bool reported() const {
        return system_status != "unknown" || instance_status != "unknown";
    }
};

struct Instance {
    std::string id;
    std::string region;
    std::string name;
    std::string instance_type;
    std::string public_ip;      // empty when none assigned
    std::string private_ip;
    std::string launch_time;    // remote ISO timestamp, display only
    InstanceState state = InstanceState::Unknown;

    // ── Local bookkeeping (never sent by the remote) ─────────
    bool pinned = false;
    std::chrono::system_clock::time_point last_confirmed{};
    std::optional<OptimisticOverlay> optimistic;
    int misses = 0;             // consecutive successful fetches without this id
    bool stale = false;         // kept from an earlier snapshot
    uint64_t order = 0;         // first-seen sequence, drives stable ordering
};

// What a consumer should show: the overlay hint while one is live,
// otherwise the confirmed state. Reboot shows as "rebooting".
std::string display_state(const Instance& inst);

// Global identity of an instance
struct InstanceKey {
    std::string region;
    std::string id;

    bool operator<(const InstanceKey& o) const {
        return region != o.region ? region < o.region : id < o.id;
    }
    bool operator==(const InstanceKey& o) const {
        return region == o.region && id == o.id;
    }
};

// One region's fetched instance set.
struct RegionSnapshot {
    std::string region;
    std::vector<Instance> instances;
    std::chrono::system_clock::time_point as_of{};
    std::map<std::string, InstanceHealth> health;   // by id, only for rebooting instances
};

#pragma once

#include <string>
#include <vector>
#include <memory>
#include <future>
#include <core/config.hpp>
#include <cloud/compute_api.hpp>
#include "change_feed.hpp"
#include "state_cache.hpp"
#include "region_catalog.hpp"
#include "instance_fetcher.hpp"
#include "refresh_scheduler.hpp"
#include "action_dispatcher.hpp"
#include "snapshot_store.hpp"

// Pure data struct for UI consumption.
struct InstanceSummary {
    std::string region;
    std::string id;
    std::string name;
    std::string type;
    std::string state;          // display state, overlay hint included
    std::string public_ip;      // "-" when none
    std::string private_ip;
    std::string launched;       // local "YYYY-MM-DD HH:MM:SS" or "N/A"
    std::string age;            // age of the confirmed data, e.g. "45s"
    bool pinned = false;
    bool stale = false;         // instance or its region is stale
    bool pending_action = false;
};

// Headless service facade. Owns the cache and everything that feeds it;
// any frontend (REPL, one-shot list, tests) drives the fleet through here.
class FleetService {
public:
    // Loads ~/.ec2ctl/config.yaml.
    FleetService();

    // Explicit wiring. A null api means the aws CLI backend; an empty
    // state path means the default ~/.ec2ctl/state.yaml.
    FleetService(Config config, std::unique_ptr<ComputeApi> api, fs::path state_path = {});

    ~FleetService();

    FleetService(const FleetService&) = delete;
    FleetService& operator=(const FleetService&) = delete;

    // ── Lifecycle ─────────────────────────────────────────────

    // Build the managers, restore the last snapshot and list regions.
    // Fails on configuration or credential errors. Starts periodic
    // refresh when the configuration asks for it.
    Result<void> init(StatusCallback cb = nullptr);

    // Stop the scheduler, save the snapshot and drop the managers.
    void teardown();

    bool is_initialized() const { return cache_ != nullptr; }

    // ── Queries ───────────────────────────────────────────────

    std::vector<Instance> read(const CacheFilter& filter = {}) const;
    std::vector<InstanceSummary> list_instances(const CacheFilter& filter = {}) const;
    bool is_stale(const std::string& region) const;
    std::vector<RegionStatus> region_status() const;

    // Listed regions with their enabled flags.
    Result<std::vector<Region>> regions();

    // ── Commands ──────────────────────────────────────────────

    Result<void> request_action(const std::string& region, const std::string& id,
                                InstanceAction action);
    Result<void> set_pinned(const std::string& region, const std::string& id, bool pinned);
    Result<void> set_region_enabled(const std::string& code, bool enabled);

    void set_auto_refresh(bool enabled);
    std::shared_future<ScanReport> manual_refresh();

    // Scan on the calling thread (joins a scan in flight).
    ScanReport refresh_now();

    SchedulerState scheduler_state() const;
    std::string halt_reason() const;

    Result<void> save_snapshot();

    // ── Accessors ─────────────────────────────────────────────

    const Config& config() const { return config_; }
    ChangeFeed& feed() { return feed_; }

private:
    Config config_;
    std::string config_error_;
    std::unique_ptr<ComputeApi> api_;
    fs::path state_path_;

    ChangeFeed feed_;
    std::unique_ptr<SnapshotStore> store_;
    std::unique_ptr<RegionCatalog> catalog_;
    std::unique_ptr<InstanceFetcher> fetcher_;
    std::unique_ptr<StateCache> cache_;
    std::unique_ptr<RefreshScheduler> scheduler_;
    std::unique_ptr<ActionDispatcher> dispatcher_;
    int save_subscription_ = 0;

    void init_managers();
    void clear_managers();
};

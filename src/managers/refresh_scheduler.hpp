#pragma once

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <thread>
#include <future>
#include <chrono>
#include <condition_variable>
#include <core/types.hpp>
#include "region_catalog.hpp"
#include "instance_fetcher.hpp"
#include "state_cache.hpp"

enum class SchedulerState {
    Idle,       // constructed, periodic ticking not started
    Scanning,   // periodic ticking active
    Paused,     // periodic ticking suspended (manual refresh still works)
};

const char* scheduler_state_name(SchedulerState state);

struct RegionOutcome {
    std::string region;
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    size_t instances = 0;
};

struct ScanReport {
    uint64_t tick = 0;
    bool aborted = false;               // no region was fetched
    ErrorKind abort_kind = ErrorKind::None;
    std::string abort_error;
    std::vector<RegionOutcome> regions;
    std::chrono::milliseconds duration{0};

    int succeeded() const;
    int failed() const;
};

struct SchedulerOptions {
    std::chrono::milliseconds interval{REFRESH_INTERVAL_SECS * 1000};
    int workers = FETCH_WORKERS;
};

// Drives refresh scans. At most one scan runs at a time: a refresh request
// that arrives while a scan is in flight joins that scan instead of starting
// another, so every region sees at most one fetch in flight.
//
// Periodic ticks run on an internal loop thread. run_tick() performs a scan
// on the calling thread, which lets tests drive ticks without real delays.
class RefreshScheduler {
public:
    RefreshScheduler(RegionCatalog& catalog, InstanceFetcher& fetcher,
                     StateCache& cache, SchedulerOptions options);
    ~RefreshScheduler();

    RefreshScheduler(const RefreshScheduler&) = delete;
    RefreshScheduler& operator=(const RefreshScheduler&) = delete;

    // idle -> scanning. The first periodic tick fires one interval later.
    void start();

    // any -> paused. Cancels the next tick only; a scan in flight still
    // finishes and is committed.
    void pause();

    // paused -> scanning. Also clears a halt caused by an auth failure.
    void resume();

    void set_auto_refresh(bool enabled);

    // Request a scan on the loop thread. Coalesces with a scan in flight.
    std::shared_future<ScanReport> manual_refresh();

    // Run one scan on the calling thread (or wait for the one in flight).
    ScanReport run_tick();

    SchedulerState state() const;
    bool scan_in_flight() const;

    // Non-empty after an auth failure halted periodic ticking.
    std::string halt_reason() const;

    // Stop the loop thread. Idempotent; called by the destructor.
    void shutdown();

private:
    using Promise = std::promise<ScanReport>;

    RegionCatalog& catalog_;
    InstanceFetcher& fetcher_;
    StateCache& cache_;
    SchedulerOptions options_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    SchedulerState state_ = SchedulerState::Idle;
    std::thread thread_;
    bool stopping_ = false;

    bool inflight_active_ = false;
    std::shared_future<ScanReport> inflight_;
    std::shared_ptr<Promise> queued_;       // manual request waiting for the loop
    std::chrono::steady_clock::time_point next_tick_;
    std::string halt_reason_;

    // Join the scan in flight, or reserve a new one. `owner` is set when the
    // caller must execute the reserved scan.
    std::shared_future<ScanReport> begin_scan_unlocked(std::shared_ptr<Promise>& owner);
    void execute_scan(const std::shared_ptr<Promise>& promise);
    ScanReport scan();
    void halt(const std::string& reason);

    void ensure_loop_unlocked();
    void loop();
};

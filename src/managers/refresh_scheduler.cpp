#include "refresh_scheduler.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <atomic>

const char* scheduler_state_name(SchedulerState state) {
    switch (state) {
        case SchedulerState::Idle:     return "idle";
        case SchedulerState::Scanning: return "scanning";
        case SchedulerState::Paused:   return "paused";
    }
    return "?";
}

int ScanReport::succeeded() const {
    return static_cast<int>(std::count_if(regions.begin(), regions.end(),
                                          [](const RegionOutcome& r) { return r.ok; }));
}

int ScanReport::failed() const {
    return static_cast<int>(regions.size()) - succeeded();
}

// ── Construction / Destruction ──────────────────────────────

RefreshScheduler::RefreshScheduler(RegionCatalog& catalog, InstanceFetcher& fetcher,
                                   StateCache& cache, SchedulerOptions options)
    : catalog_(catalog), fetcher_(fetcher), cache_(cache), options_(options) {
    if (options_.workers < 1) options_.workers = 1;
    if (options_.interval.count() < 1) options_.interval = std::chrono::milliseconds(1);
}

RefreshScheduler::~RefreshScheduler() {
    shutdown();
}

void RefreshScheduler::shutdown() {
    std::shared_ptr<Promise> orphan;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && !thread_.joinable()) return;
        stopping_ = true;
        orphan = std::move(queued_);
        queued_.reset();
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();

    // A manual request that never reached the loop still gets an answer
    if (orphan) {
        ScanReport report;
        report.aborted = true;
        report.abort_error = "scheduler stopped";
        {
            std::lock_guard<std::mutex> lock(mutex_);
            inflight_active_ = false;
            inflight_ = {};
        }
        orphan->set_value(report);
    }
}

// ── State transitions ───────────────────────────────────────

void RefreshScheduler::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SchedulerState::Idle || stopping_) return;
    state_ = SchedulerState::Scanning;
    next_tick_ = std::chrono::steady_clock::now() + options_.interval;
    ensure_loop_unlocked();
    cv_.notify_all();
    ec2ctl_log("scheduler: started");
}

void RefreshScheduler::pause() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SchedulerState::Paused) return;
    state_ = SchedulerState::Paused;
    cv_.notify_all();
    ec2ctl_log("scheduler: paused");
}

void RefreshScheduler::resume() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SchedulerState::Paused || stopping_) return;
    state_ = SchedulerState::Scanning;
    halt_reason_.clear();
    next_tick_ = std::chrono::steady_clock::now() + options_.interval;
    ensure_loop_unlocked();
    cv_.notify_all();
    ec2ctl_log("scheduler: resumed");
}

void RefreshScheduler::set_auto_refresh(bool enabled) {
    if (!enabled) {
        pause();
        return;
    }
    SchedulerState s = state();
    if (s == SchedulerState::Idle) {
        start();
    } else if (s == SchedulerState::Paused) {
        resume();
    }
}

SchedulerState RefreshScheduler::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool RefreshScheduler::scan_in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inflight_active_;
}

std::string RefreshScheduler::halt_reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return halt_reason_;
}

void RefreshScheduler::halt(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = SchedulerState::Paused;
    halt_reason_ = reason;
    ec2ctl_log("scheduler: halted: " + reason);
}

// ── Scan requests ───────────────────────────────────────────

std::shared_future<ScanReport> RefreshScheduler::begin_scan_unlocked(std::shared_ptr<Promise>& owner) {
    if (inflight_active_) {
        return inflight_;
    }
    owner = std::make_shared<Promise>();
    inflight_ = owner->get_future().share();
    inflight_active_ = true;
    return inflight_;
}

std::shared_future<ScanReport> RefreshScheduler::manual_refresh() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::shared_ptr<Promise> owner;
    auto future = begin_scan_unlocked(owner);
    if (!owner) {
        ec2ctl_log("scheduler: manual refresh joined scan in flight");
        return future;
    }
    if (stopping_) {
        ScanReport report;
        report.aborted = true;
        report.abort_error = "scheduler stopped";
        inflight_active_ = false;
        inflight_ = {};
        owner->set_value(report);
        return future;
    }
    queued_ = owner;
    ensure_loop_unlocked();
    cv_.notify_all();
    return future;
}

ScanReport RefreshScheduler::run_tick() {
    std::shared_ptr<Promise> owner;
    std::shared_future<ScanReport> future;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        future = begin_scan_unlocked(owner);
    }
    if (owner) execute_scan(owner);
    return future.get();
}

void RefreshScheduler::execute_scan(const std::shared_ptr<Promise>& promise) {
    ScanReport report;
    try {
        report = scan();
    } catch (const std::exception& e) {
        ec2ctl_log(std::string("scheduler: scan failed: ") + e.what());
        report.aborted = true;
        report.abort_error = e.what();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        inflight_active_ = false;
        inflight_ = {};
    }
    promise->set_value(report);
}

// ── Scan ────────────────────────────────────────────────────

namespace {

// Joins every started worker on scope exit, including when spawning throws
struct PoolJoiner {
    std::vector<std::thread> threads;
    ~PoolJoiner() {
        for (auto& t : threads) {
            if (t.joinable()) t.join();
        }
    }
};

}  // namespace

ScanReport RefreshScheduler::scan() {
    auto started = std::chrono::steady_clock::now();
    ScanReport report;
    report.tick = cache_.advance_tick();

    auto listed = catalog_.list_regions();
    if (listed.is_err()) {
        report.aborted = true;
        report.abort_kind = listed.kind;
        report.abort_error = listed.error;
        if (listed.kind == ErrorKind::Auth) halt(listed.error);
        cache_.feed().publish(CacheEvent{0, CacheEventKind::ScanCompleted, "", "",
                                         "aborted: " + listed.error});
        return report;
    }

    std::vector<Region> regions = catalog_.enabled_regions();
    std::vector<Result<RegionSnapshot>> results(
        regions.size(), Result<RegionSnapshot>::Err(ErrorKind::RegionUnavailable, "not fetched"));

    // Status checks are only read for instances with a reboot outstanding
    std::vector<std::vector<std::string>> rebooting(regions.size());
    for (size_t i = 0; i < regions.size(); ++i) {
        rebooting[i] = cache_.rebooting_ids(regions[i].code);
    }

    // Fixed worker budget pulling regions off a shared index
    std::atomic<size_t> next{0};
    auto worker = [&]() {
        for (;;) {
            size_t i = next.fetch_add(1);
            if (i >= regions.size()) return;
            try {
                results[i] = fetcher_.fetch_instances(regions[i].code, rebooting[i]);
            } catch (const std::exception& e) {
                results[i] = Result<RegionSnapshot>::Err(ErrorKind::RegionUnavailable,
                    fmt::format("{}: fetch threw: {}", regions[i].code, e.what()));
            }
        }
    };

    {
        size_t n_workers = std::min(regions.size(), static_cast<size_t>(options_.workers));
        PoolJoiner pool;
        for (size_t k = 1; k < n_workers; ++k) {
            pool.threads.emplace_back(worker);
        }
        if (n_workers > 0) worker();
    }

    // Commit once every fetch has settled
    std::string auth_failure;
    for (size_t i = 0; i < regions.size(); ++i) {
        RegionOutcome outcome;
        outcome.region = regions[i].code;
        auto& r = results[i];
        if (r.is_ok()) {
            outcome.ok = true;
            outcome.instances = r.value.instances.size();
            cache_.merge_confirmed(r.value);
        } else {
            outcome.kind = r.kind;
            outcome.error = r.error;
            cache_.mark_fetch_failed(regions[i].code, r.error);
            ec2ctl_log(fmt::format("scheduler: warning: {} unavailable: {}", regions[i].code, r.error));
            if (r.kind == ErrorKind::Auth && auth_failure.empty()) auth_failure = r.error;
        }
        report.regions.push_back(outcome);
    }
    if (!auth_failure.empty()) halt(auth_failure);

    report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    ec2ctl_log(fmt::format("scheduler: tick {} done in {}ms: {} ok, {} failed",
                           report.tick, report.duration.count(), report.succeeded(), report.failed()));
    cache_.feed().publish(CacheEvent{0, CacheEventKind::ScanCompleted, "", "",
                                     fmt::format("{} ok, {} failed", report.succeeded(), report.failed())});
    return report;
}

// ── Loop thread ─────────────────────────────────────────────

void RefreshScheduler::ensure_loop_unlocked() {
    if (thread_.joinable() || stopping_) return;
    thread_ = std::thread(&RefreshScheduler::loop, this);
}

void RefreshScheduler::loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (queued_) {
            auto promise = std::move(queued_);
            queued_.reset();
            lock.unlock();
            execute_scan(promise);
            lock.lock();
            continue;
        }

        auto now = std::chrono::steady_clock::now();
        if (state_ == SchedulerState::Scanning && now >= next_tick_) {
            std::shared_ptr<Promise> owner;
            begin_scan_unlocked(owner);
            if (owner) {
                lock.unlock();
                execute_scan(owner);
                lock.lock();
            }
            // Next tick counts from the end of this one
            next_tick_ = std::chrono::steady_clock::now() + options_.interval;
            continue;
        }

        if (state_ == SchedulerState::Scanning) {
            cv_.wait_until(lock, next_tick_);
        } else {
            cv_.wait(lock);
        }
    }
}

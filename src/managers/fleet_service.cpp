#include "fleet_service.hpp"
#include <cloud/aws_cli_api.hpp>
#include <core/time_utils.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

FleetService::FleetService() {
    auto config_result = Config::load();
    if (config_result.is_ok()) {
        config_ = config_result.value;
    } else {
        config_error_ = config_result.error;
    }
}

FleetService::FleetService(Config config, std::unique_ptr<ComputeApi> api, fs::path state_path)
    : config_(std::move(config)), api_(std::move(api)), state_path_(std::move(state_path)) {}

FleetService::~FleetService() {
    teardown();
}

// ── Lifecycle ─────────────────────────────────────────────────

Result<void> FleetService::init(StatusCallback cb) {
    if (!config_error_.empty()) {
        return Result<void>::Err(ErrorKind::Config, config_error_);
    }
    if (is_initialized()) return Result<void>::Ok();

    init_managers();

    // Last session's view, shown stale until the first merge
    auto snap = store_->load();
    if (!snap.instances.empty() || !snap.pinned.empty()) {
        cache_->restore(snap.instances, snap.saved_at, snap.pinned);
        if (cb) cb(fmt::format("Restored {} cached instances", snap.instances.size()));
    }

    if (cb) cb("Listing regions...");
    auto listed = catalog_->list_regions();
    if (listed.is_err()) {
        if (listed.kind == ErrorKind::Auth) {
            clear_managers();
            return Result<void>::Err(listed);
        }
        // Unreachable endpoint: keep going on cached data, the next tick retries
        ec2ctl_log("fleet: region listing failed: " + listed.error);
        if (cb) cb("Warning: " + listed.error);
    } else if (cb) {
        cb(fmt::format("{} regions, {} enabled", listed.value.size(),
                       catalog_->enabled_regions().size()));
    }

    if (config_.refresh().auto_refresh) {
        scheduler_->start();
        scheduler_->manual_refresh();
    }
    return Result<void>::Ok();
}

void FleetService::teardown() {
    if (!is_initialized()) return;
    scheduler_->shutdown();
    auto saved = save_snapshot();
    if (saved.is_err()) {
        ec2ctl_log("fleet: snapshot not saved: " + saved.error);
    }
    clear_managers();
}

void FleetService::init_managers() {
    if (!api_) {
        api_ = std::make_unique<AwsCliApi>(config_.aws(), config_.refresh().page_size);
    }
    const auto& refresh = config_.refresh();
    const auto& policy = config_.policy();

    store_ = std::make_unique<SnapshotStore>(state_path_.empty() ? get_state_path() : state_path_);
    catalog_ = std::make_unique<RegionCatalog>(*api_, config_.regions());
    fetcher_ = std::make_unique<InstanceFetcher>(*api_, refresh.fetch_timeout_secs);
    cache_ = std::make_unique<StateCache>(feed_, refresh.stale_ttl_secs, policy.eviction_misses);

    SchedulerOptions opts;
    opts.interval = std::chrono::seconds(refresh.interval_secs);
    opts.workers = refresh.workers;
    scheduler_ = std::make_unique<RefreshScheduler>(*catalog_, *fetcher_, *cache_, opts);
    dispatcher_ = std::make_unique<ActionDispatcher>(*api_, *cache_, policy);

    // Persist after every committed scan
    save_subscription_ = feed_.subscribe([this](const CacheEvent& ev) {
        if (ev.kind != CacheEventKind::ScanCompleted) return;
        auto saved = save_snapshot();
        if (saved.is_err()) {
            ec2ctl_log("fleet: snapshot not saved: " + saved.error);
        }
    });
}

void FleetService::clear_managers() {
    if (save_subscription_) {
        feed_.unsubscribe(save_subscription_);
        save_subscription_ = 0;
    }
    // Reverse order of construction
    scheduler_.reset();
    dispatcher_.reset();
    cache_.reset();
    fetcher_.reset();
    catalog_.reset();
    store_.reset();
}

Result<void> FleetService::save_snapshot() {
    if (!is_initialized()) return Result<void>::Err(ErrorKind::Config, "Not initialized");

    PersistedSnapshot snap;
    snap.saved_at = std::chrono::system_clock::now();
    snap.pinned = cache_->pinned_keys();
    for (auto& inst : cache_->read()) {
        // Evicted-pending and never-confirmed data is not worth carrying over
        if (inst.last_confirmed == std::chrono::system_clock::time_point{}) continue;
        snap.instances.push_back(std::move(inst));
    }
    return store_->save(snap);
}

// ── Queries ───────────────────────────────────────────────────

std::vector<Instance> FleetService::read(const CacheFilter& filter) const {
    if (!cache_) return {};
    return cache_->read(filter);
}

std::vector<InstanceSummary> FleetService::list_instances(const CacheFilter& filter) const {
    std::vector<InstanceSummary> out;
    if (!cache_) return out;

    auto now = std::chrono::system_clock::now();
    for (const auto& inst : cache_->read(filter)) {
        InstanceSummary s;
        s.region = inst.region;
        s.id = inst.id;
        s.name = inst.name;
        s.type = inst.instance_type;
        s.state = display_state(inst);
        s.public_ip = inst.public_ip.empty() ? "-" : inst.public_ip;
        s.private_ip = inst.private_ip.empty() ? "-" : inst.private_ip;
        s.launched = format_launch_time(inst.launch_time);
        s.age = format_snapshot_age(inst.last_confirmed, now);
        s.pinned = inst.pinned;
        s.stale = inst.stale || cache_->is_stale(inst.region, now);
        s.pending_action = inst.optimistic.has_value();
        out.push_back(s);
    }
    return out;
}

bool FleetService::is_stale(const std::string& region) const {
    if (!cache_) return true;
    return cache_->is_stale(region);
}

std::vector<RegionStatus> FleetService::region_status() const {
    if (!cache_) return {};
    return cache_->regions();
}

Result<std::vector<Region>> FleetService::regions() {
    if (!catalog_) return Result<std::vector<Region>>::Err(ErrorKind::Config, "Not initialized");
    return catalog_->list_regions();
}

// ── Commands ──────────────────────────────────────────────────

Result<void> FleetService::request_action(const std::string& region, const std::string& id,
                                          InstanceAction action) {
    if (!dispatcher_) return Result<void>::Err(ErrorKind::Config, "Not initialized");
    auto result = dispatcher_->request_action(region, id, action);
    if (result.is_err() && result.kind == ErrorKind::Auth) {
        scheduler_->pause();
    }
    return result;
}

Result<void> FleetService::set_pinned(const std::string& region, const std::string& id, bool pinned) {
    if (!cache_) return Result<void>::Err(ErrorKind::Config, "Not initialized");
    if (!cache_->set_pinned(region, id, pinned)) {
        return Result<void>::Err(ErrorKind::Rejected, "unknown instance " + id + " in " + region);
    }
    return Result<void>::Ok();
}

Result<void> FleetService::set_region_enabled(const std::string& code, bool enabled) {
    if (!catalog_) return Result<void>::Err(ErrorKind::Config, "Not initialized");
    auto listed = catalog_->list_regions();
    if (listed.is_err()) return Result<void>::Err(listed);
    if (!catalog_->set_enabled(code, enabled)) {
        return Result<void>::Err(ErrorKind::Rejected, "unknown region " + code);
    }
    ec2ctl_log(fmt::format("fleet: region {} {}", code, enabled ? "enabled" : "disabled"));
    return Result<void>::Ok();
}

void FleetService::set_auto_refresh(bool enabled) {
    if (scheduler_) scheduler_->set_auto_refresh(enabled);
}

std::shared_future<ScanReport> FleetService::manual_refresh() {
    if (!scheduler_) {
        std::promise<ScanReport> p;
        ScanReport report;
        report.aborted = true;
        report.abort_kind = ErrorKind::Config;
        report.abort_error = "Not initialized";
        p.set_value(report);
        return p.get_future().share();
    }
    return scheduler_->manual_refresh();
}

ScanReport FleetService::refresh_now() {
    if (!scheduler_) {
        ScanReport report;
        report.aborted = true;
        report.abort_kind = ErrorKind::Config;
        report.abort_error = "Not initialized";
        return report;
    }
    return scheduler_->run_tick();
}

SchedulerState FleetService::scheduler_state() const {
    return scheduler_ ? scheduler_->state() : SchedulerState::Idle;
}

std::string FleetService::halt_reason() const {
    return scheduler_ ? scheduler_->halt_reason() : std::string();
}

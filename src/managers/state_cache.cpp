#include "state_cache.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>

std::optional<SortKey> parse_sort_key(const std::string& name) {
    if (name == "region") return SortKey::Region;
    if (name == "name")   return SortKey::Name;
    if (name == "id")     return SortKey::Id;
    if (name == "state")  return SortKey::State;
    if (name == "type")   return SortKey::Type;
    if (name == "public_ip")  return SortKey::PublicIp;
    if (name == "private_ip") return SortKey::PrivateIp;
    return std::nullopt;
}

StateCache::StateCache(ChangeFeed& feed, int stale_ttl_secs, int eviction_misses)
    : feed_(feed), reconciler_(eviction_misses), stale_ttl_(stale_ttl_secs) {}

// ── Helpers ─────────────────────────────────────────────────

RegionEntry& StateCache::entry_unlocked(const std::string& region) {
    auto it = regions_.find(region);
    if (it != regions_.end()) return it->second;

    region_order_.push_back(region);
    RegionEntry& e = regions_[region];
    e.region = region;
    return e;
}

Instance* StateCache::find_unlocked(const std::string& region, const std::string& id) {
    auto it = regions_.find(region);
    if (it == regions_.end()) return nullptr;
    for (auto& inst : it->second.instances) {
        if (inst.id == id) return &inst;
    }
    return nullptr;
}

bool StateCache::is_stale_unlocked(const RegionEntry& entry,
                                   std::chrono::system_clock::time_point now) const {
    if (!entry.confirmed || entry.last_fetch_failed) return true;
    return now - entry.as_of > stale_ttl_;
}

// Display ordering for the state column
static int state_rank(const Instance& inst) {
    std::string s = display_state(inst);
    if (s == "running")       return 1;
    if (s == "rebooting")     return 2;
    if (s == "pending")       return 3;
    if (s == "stopping")      return 4;
    if (s == "stopped")       return 5;
    if (s == "shutting-down") return 6;
    if (s == "terminated")    return 7;
    return 99;
}

// Zero-pad dotted quads so "10.0.0.9" sorts before "10.0.0.10"
static std::string ip_sort_value(const std::string& ip) {
    std::string out, octet;
    int dots = 0;
    for (size_t i = 0; i <= ip.size(); ++i) {
        if (i < ip.size() && ip[i] != '.') {
            octet += ip[i];
            continue;
        }
        if (octet.empty() || octet.size() > 3) return ip;
        out += std::string(3 - octet.size(), '0') + octet;
        if (i < ip.size()) { out += '.'; dots++; }
        octet.clear();
    }
    return dots == 3 ? out : ip;
}

static std::string sort_field(const Instance& inst, SortKey key) {
    switch (key) {
        case SortKey::Region:    return inst.region;
        case SortKey::Name:      return inst.name;
        case SortKey::Id:        return inst.id;
        case SortKey::Type:      return inst.instance_type;
        case SortKey::PublicIp:  return ip_sort_value(inst.public_ip);
        case SortKey::PrivateIp: return ip_sort_value(inst.private_ip);
        case SortKey::State:     break;
    }
    return inst.id;
}

// ── Queries ─────────────────────────────────────────────────

std::vector<Instance> StateCache::read(const CacheFilter& filter) const {
    std::vector<Instance> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& code : region_order_) {
            if (filter.region && *filter.region != code) continue;
            const auto& entry = regions_.at(code);
            for (const auto& inst : entry.instances) {
                if (filter.state && inst.state != *filter.state) continue;
                out.push_back(inst);
            }
        }
    }

    std::stable_sort(out.begin(), out.end(),
                     [](const Instance& a, const Instance& b) { return a.order < b.order; });

    auto unpinned = std::stable_partition(out.begin(), out.end(),
                                          [](const Instance& i) { return i.pinned; });

    if (filter.sort) {
        SortKey key = *filter.sort;
        bool desc = filter.descending;
        std::stable_sort(unpinned, out.end(), [key, desc](const Instance& a, const Instance& b) {
            if (key == SortKey::State) {
                return desc ? state_rank(b) < state_rank(a) : state_rank(a) < state_rank(b);
            }
            std::string va = to_lower(sort_field(a, key));
            std::string vb = to_lower(sort_field(b, key));
            // Empty values go last in both directions
            if (va.empty() != vb.empty()) return vb.empty();
            return desc ? vb < va : va < vb;
        });
    }
    return out;
}

std::optional<Instance> StateCache::find(const std::string& region, const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = regions_.find(region);
    if (it == regions_.end()) return std::nullopt;
    for (const auto& inst : it->second.instances) {
        if (inst.id == id) return inst;
    }
    return std::nullopt;
}

bool StateCache::is_stale(const std::string& region) const {
    return is_stale(region, std::chrono::system_clock::now());
}

bool StateCache::is_stale(const std::string& region,
                          std::chrono::system_clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = regions_.find(region);
    if (it == regions_.end()) return true;
    return is_stale_unlocked(it->second, now);
}

std::vector<RegionStatus> StateCache::regions() const {
    return regions(std::chrono::system_clock::now());
}

std::vector<RegionStatus> StateCache::regions(std::chrono::system_clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RegionStatus> out;
    for (const auto& code : region_order_) {
        const auto& e = regions_.at(code);
        RegionStatus s;
        s.code = code;
        s.instance_count = e.instances.size();
        s.as_of = e.as_of;
        s.stale = is_stale_unlocked(e, now);
        s.last_fetch_failed = e.last_fetch_failed;
        s.last_error = e.last_error;
        out.push_back(s);
    }
    return out;
}

std::vector<std::string> StateCache::rebooting_ids(const std::string& region) const {
    std::vector<std::string> ids;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = regions_.find(region);
    if (it == regions_.end()) return ids;
    for (const auto& inst : it->second.instances) {
        if (inst.optimistic && inst.optimistic->action == InstanceAction::Reboot) {
            ids.push_back(inst.id);
        }
    }
    return ids;
}

// ── Writers ─────────────────────────────────────────────────

bool StateCache::apply_optimistic(const std::string& region, const std::string& id,
                                  InstanceAction action, InstanceState target_state,
                                  int expires_after_ticks, int health_wait_ticks) {
    CacheEvent event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Instance* inst = find_unlocked(region, id);
        if (!inst) return false;

        OptimisticOverlay overlay;
        overlay.action = action;
        overlay.target_state = target_state;
        overlay.issued_at_tick = tick_;
        overlay.expires_after_ticks = expires_after_ticks < 1 ? 1 : expires_after_ticks;
        overlay.health_wait_ticks = std::max(overlay.expires_after_ticks, health_wait_ticks);
        inst->optimistic = overlay;

        event = {0, CacheEventKind::OverlayApplied, region, id, display_state(*inst)};
    }
    feed_.publish(std::move(event));
    return true;
}

MergeStats StateCache::merge_confirmed(const RegionSnapshot& fresh) {
    std::vector<CacheEvent> events;
    MergeStats stats;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        RegionEntry& entry = entry_unlocked(fresh.region);
        stats = reconciler_.merge(entry, fresh, tick_, next_order_, pinned_, events);
    }

    if (!stats.ignored) {
        ec2ctl_log(fmt::format("cache: merged {} (+{} ~{} -{}, overlays {}/{}/{})",
                               fresh.region, stats.added, stats.updated, stats.evicted,
                               stats.overlays_confirmed, stats.overlays_discarded,
                               stats.overlays_retained));
    }
    feed_.publish(std::move(events));
    return stats;
}

void StateCache::mark_fetch_failed(const std::string& region, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        RegionEntry& entry = entry_unlocked(region);
        entry.last_fetch_failed = true;
        entry.last_error = reason;
    }
    feed_.publish(CacheEvent{0, CacheEventKind::RegionFailed, region, "", reason});
}

bool StateCache::set_pinned(const std::string& region, const std::string& id, bool pinned) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Instance* inst = find_unlocked(region, id);
        if (!inst) return false;
        if (inst->pinned == pinned) return true;
        inst->pinned = pinned;
        if (pinned) {
            pinned_.insert({region, id});
        } else {
            pinned_.erase({region, id});
        }
    }
    feed_.publish(CacheEvent{0, CacheEventKind::PinChanged, region, id, pinned ? "pinned" : "unpinned"});
    return true;
}

std::set<InstanceKey> StateCache::pinned_keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pinned_;
}

void StateCache::restore(const std::vector<Instance>& instances,
                         std::chrono::system_clock::time_point as_of,
                         const std::set<InstanceKey>& pinned) {
    std::lock_guard<std::mutex> lock(mutex_);
    pinned_.insert(pinned.begin(), pinned.end());

    for (const auto& src : instances) {
        if (src.id.empty() || src.region.empty()) continue;
        if (find_unlocked(src.region, src.id)) continue;

        RegionEntry& entry = entry_unlocked(src.region);
        Instance inst = src;
        inst.optimistic.reset();
        inst.pinned = pinned_.count({src.region, src.id}) > 0;
        inst.stale = true;
        inst.misses = 0;
        inst.order = next_order_++;
        entry.instances.push_back(std::move(inst));
        if (entry.as_of < as_of) entry.as_of = as_of;
    }
}

uint64_t StateCache::advance_tick() {
    std::lock_guard<std::mutex> lock(mutex_);
    return ++tick_;
}

uint64_t StateCache::current_tick() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tick_;
}

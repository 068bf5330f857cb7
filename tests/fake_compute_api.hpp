#pragma once

#include <cloud/compute_api.hpp>
#include <map>
#include <set>
#include <stdexcept>
#include <mutex>
#include <condition_variable>
#include <algorithm>
#include <thread>
#include <chrono>

// In-process ComputeApi for tests. Regions, instances and failures are
// scripted; fetches can be held open to observe concurrency.
class FakeComputeApi : public ComputeApi {
public:
    // ── Scripting ────────────────────────────────────────────

    void add_region(const std::string& code) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (std::find(regions_.begin(), regions_.end(), code) == regions_.end())
            regions_.push_back(code);
    }

    void put(const std::string& region, const std::string& id, InstanceState state,
             const std::string& name = "", const std::string& type = "t3.micro") {
        add_region(region);
        std::lock_guard<std::mutex> lock(mutex_);
        Instance inst;
        inst.id = id;
        inst.region = region;
        inst.name = name;
        inst.instance_type = type;
        inst.state = state;
        auto& list = instances_[region];
        auto it = std::find_if(list.begin(), list.end(), [&](const Instance& i) { return i.id == id; });
        if (it != list.end()) *it = inst; else list.push_back(inst);
    }

    void set_state(const std::string& region, const std::string& id, InstanceState state) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& i : instances_[region]) {
            if (i.id == id) i.state = state;
        }
    }

    void remove(const std::string& region, const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& list = instances_[region];
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [&](const Instance& i) { return i.id == id; }), list.end());
    }

    void fail_region(const std::string& region, ErrorKind kind, const std::string& msg) {
        std::lock_guard<std::mutex> lock(mutex_);
        region_failures_[region] = {kind, msg};
    }

    void heal_region(const std::string& region) {
        std::lock_guard<std::mutex> lock(mutex_);
        region_failures_.erase(region);
    }

    void fail_listing(ErrorKind kind, const std::string& msg) {
        std::lock_guard<std::mutex> lock(mutex_);
        listing_failure_ = {kind, msg};
    }

    void fail_actions(ErrorKind kind, const std::string& msg) {
        std::lock_guard<std::mutex> lock(mutex_);
        action_failure_ = {kind, msg};
    }

    void set_page_size(size_t n) {
        std::lock_guard<std::mutex> lock(mutex_);
        page_size_ = n;
    }

    void set_describe_delay(std::chrono::milliseconds d) {
        std::lock_guard<std::mutex> lock(mutex_);
        describe_delay_ = d;
    }

    // describe_instances for `region` throws instead of returning
    void throw_on_describe(const std::string& region) {
        std::lock_guard<std::mutex> lock(mutex_);
        throwing_regions_.insert(region);
    }

    void set_health(const std::string& region, const std::string& id,
                    const std::string& system, const std::string& instance) {
        std::lock_guard<std::mutex> lock(mutex_);
        InstanceHealth h;
        h.instance_state = "running";
        h.system_status = system;
        h.instance_status = instance;
        health_[region + "/" + id] = h;
    }

    void fail_status(ErrorKind kind, const std::string& msg) {
        std::lock_guard<std::mutex> lock(mutex_);
        status_failure_ = {kind, msg};
    }

    // Every describe call blocks until release_fetches()
    void hold_fetches() {
        std::lock_guard<std::mutex> lock(mutex_);
        held_ = true;
    }

    void release_fetches() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            held_ = false;
        }
        cv_.notify_all();
    }

    // Wait until at least `n` describe calls are blocked or running.
    bool wait_in_flight(int n, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return in_flight_ >= n; });
    }

    // ── Observations ─────────────────────────────────────────

    int list_calls() const { std::lock_guard<std::mutex> l(mutex_); return list_calls_; }
    int describe_calls(const std::string& region) const {
        std::lock_guard<std::mutex> l(mutex_);
        auto it = describe_calls_.find(region);
        return it == describe_calls_.end() ? 0 : it->second;
    }
    int total_describe_calls() const {
        std::lock_guard<std::mutex> l(mutex_);
        int n = 0;
        for (const auto& [r, c] : describe_calls_) n += c;
        return n;
    }
    int status_calls() const { std::lock_guard<std::mutex> l(mutex_); return status_calls_; }
    std::chrono::milliseconds last_timeout(const std::string& region) const {
        std::lock_guard<std::mutex> l(mutex_);
        auto it = last_timeout_.find(region);
        return it == last_timeout_.end() ? std::chrono::milliseconds(0) : it->second;
    }
    int max_concurrent() const { std::lock_guard<std::mutex> l(mutex_); return max_in_flight_; }
    std::vector<std::string> actions() const { std::lock_guard<std::mutex> l(mutex_); return actions_; }

    // ── ComputeApi ───────────────────────────────────────────

    Result<std::vector<std::string>> list_regions(std::chrono::milliseconds) override {
        std::lock_guard<std::mutex> lock(mutex_);
        list_calls_++;
        if (listing_failure_.first != ErrorKind::None)
            return Result<std::vector<std::string>>::Err(listing_failure_.first, listing_failure_.second);
        return Result<std::vector<std::string>>::Ok(regions_);
    }

    Result<InstancePage> describe_instances(const std::string& region, const std::string& token,
                                            std::chrono::milliseconds timeout) override {
        std::unique_lock<std::mutex> lock(mutex_);
        describe_calls_[region]++;
        last_timeout_[region] = timeout;
        if (throwing_regions_.count(region))
            throw std::runtime_error("injected failure in " + region);
        in_flight_++;
        max_in_flight_ = std::max(max_in_flight_, in_flight_);
        cv_.notify_all();
        cv_.wait(lock, [&] { return !held_; });

        auto delay = describe_delay_;
        if (delay.count() > 0) {
            lock.unlock();
            std::this_thread::sleep_for(delay);
            lock.lock();
        }
        in_flight_--;

        auto f = region_failures_.find(region);
        if (f != region_failures_.end())
            return Result<InstancePage>::Err(f->second.first, f->second.second);

        const auto& all = instances_[region];
        size_t start = token.empty() ? 0 : static_cast<size_t>(std::stoul(token.substr(1)));
        size_t end = std::min(all.size(), start + page_size_);

        InstancePage page;
        for (size_t i = start; i < end; ++i) {
            Instance inst = all[i];
            inst.region.clear();    // the fetcher fills it in
            page.instances.push_back(inst);
        }
        if (end < all.size()) page.next_token = "p" + std::to_string(end);
        return Result<InstancePage>::Ok(page);
    }

    Result<InstanceHealth> describe_instance_status(const std::string& region, const std::string& id,
                                                    std::chrono::milliseconds) override {
        std::lock_guard<std::mutex> lock(mutex_);
        status_calls_++;
        if (status_failure_.first != ErrorKind::None)
            return Result<InstanceHealth>::Err(status_failure_.first, status_failure_.second);
        auto it = health_.find(region + "/" + id);
        // Unscripted instances have not published status checks yet
        return Result<InstanceHealth>::Ok(it == health_.end() ? InstanceHealth{} : it->second);
    }

    Result<void> start_instance(const std::string& r, const std::string& id,
                                std::chrono::milliseconds) override {
        return record("start", r, id);
    }
    Result<void> stop_instance(const std::string& r, const std::string& id,
                               std::chrono::milliseconds) override {
        return record("stop", r, id);
    }
    Result<void> reboot_instance(const std::string& r, const std::string& id,
                                 std::chrono::milliseconds) override {
        return record("reboot", r, id);
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::vector<std::string> regions_;
    std::map<std::string, std::vector<Instance>> instances_;
    std::map<std::string, std::pair<ErrorKind, std::string>> region_failures_;
    std::pair<ErrorKind, std::string> listing_failure_{ErrorKind::None, ""};
    std::pair<ErrorKind, std::string> action_failure_{ErrorKind::None, ""};
    size_t page_size_ = 1000;
    std::chrono::milliseconds describe_delay_{0};
    bool held_ = false;
    std::set<std::string> throwing_regions_;
    std::map<std::string, InstanceHealth> health_;
    std::pair<ErrorKind, std::string> status_failure_{ErrorKind::None, ""};

    int list_calls_ = 0;
    std::map<std::string, int> describe_calls_;
    std::map<std::string, std::chrono::milliseconds> last_timeout_;
    int status_calls_ = 0;
    int in_flight_ = 0;
    int max_in_flight_ = 0;
    std::vector<std::string> actions_;

    Result<void> record(const std::string& verb, const std::string& region, const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        actions_.push_back(verb + " " + region + " " + id);
        if (action_failure_.first != ErrorKind::None)
            return Result<void>::Err(action_failure_.first, action_failure_.second);
        return Result<void>::Ok();
    }
};

#pragma once

#include <string>
#include <vector>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <chrono>
#include <functional>
#include <condition_variable>
#include <cstdint>
#include <core/constants.hpp>

enum class CacheEventKind {
    InstanceAdded,
    InstanceUpdated,    // confirmed fields changed
    InstanceEvicted,
    OverlayApplied,
    OverlayConfirmed,
    OverlayDiscarded,
    RegionRefreshed,
    RegionFailed,       // warning: fetch failed, data kept and marked stale
    ScanCompleted,
    PinChanged,
};

struct CacheEvent {
    uint64_t seq = 0;           // assigned by ChangeFeed::publish
    CacheEventKind kind = CacheEventKind::InstanceUpdated;
    std::string region;
    std::string instance_id;
    std::string detail;
};

class ChangeCursor;

// Ordered stream of cache changes. Consumers either subscribe a callback
// (invoked on the publishing thread) or pull through a ChangeCursor.
// The feed keeps the most recent `retain` events for cursor replay.
class ChangeFeed {
public:
    using Callback = std::function<void(const CacheEvent&)>;

    explicit ChangeFeed(size_t retain = CHANGE_FEED_RETAIN);

    void publish(CacheEvent event);
    void publish(std::vector<CacheEvent> events);

    int subscribe(Callback cb);
    void unsubscribe(int id);

    // Cursor positioned before `from_seq` (0 = earliest retained event).
    ChangeCursor cursor(uint64_t from_seq = 0);

    uint64_t last_seq() const;

private:
    friend class ChangeCursor;

    // First retained event with seq > after. `skipped` counts events that
    // fell out of retention in between.
    std::optional<CacheEvent> next_after(uint64_t after, uint64_t& skipped) const;
    bool wait_for_after(uint64_t after, std::chrono::milliseconds timeout);
    uint64_t first_retained_seq() const;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<CacheEvent> events_;
    uint64_t next_seq_ = 1;
    size_t retain_;

    std::mutex subscribers_mutex_;
    std::map<int, Callback> subscribers_;
    int next_subscriber_ = 1;
};

// Lazy pull view over a ChangeFeed. Nothing is copied until next() is called;
// restart() rewinds to the earliest event still retained.
class ChangeCursor {
public:
    ChangeCursor(ChangeFeed& feed, uint64_t position);

    std::optional<CacheEvent> next();
    std::optional<CacheEvent> wait_next(std::chrono::milliseconds timeout);
    void restart();

    uint64_t dropped() const { return dropped_; }

private:
    ChangeFeed* feed_;
    uint64_t position_;         // seq of the last event returned
    uint64_t dropped_ = 0;
};

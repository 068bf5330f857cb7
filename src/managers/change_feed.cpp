#include "change_feed.hpp"

// ── ChangeFeed ──────────────────────────────────────────────

ChangeFeed::ChangeFeed(size_t retain) : retain_(retain == 0 ? 1 : retain) {}

void ChangeFeed::publish(CacheEvent event) {
    std::vector<CacheEvent> one;
    one.push_back(std::move(event));
    publish(std::move(one));
}

void ChangeFeed::publish(std::vector<CacheEvent> events) {
    if (events.empty()) return;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& e : events) {
            e.seq = next_seq_++;
            events_.push_back(e);
        }
        while (events_.size() > retain_) events_.pop_front();
    }
    cv_.notify_all();

    // Callbacks run outside the event lock so they may read the feed
    std::vector<Callback> callbacks;
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        for (const auto& [id, cb] : subscribers_) callbacks.push_back(cb);
    }
    for (const auto& e : events) {
        for (const auto& cb : callbacks) cb(e);
    }
}

int ChangeFeed::subscribe(Callback cb) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    int id = next_subscriber_++;
    subscribers_[id] = std::move(cb);
    return id;
}

void ChangeFeed::unsubscribe(int id) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    subscribers_.erase(id);
}

ChangeCursor ChangeFeed::cursor(uint64_t from_seq) {
    if (from_seq == 0) from_seq = first_retained_seq();
    return ChangeCursor(*this, from_seq == 0 ? 0 : from_seq - 1);
}

uint64_t ChangeFeed::last_seq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_seq_ - 1;
}

uint64_t ChangeFeed::first_retained_seq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.empty() ? next_seq_ : events_.front().seq;
}

std::optional<CacheEvent> ChangeFeed::next_after(uint64_t after, uint64_t& skipped) const {
    std::lock_guard<std::mutex> lock(mutex_);
    skipped = 0;
    if (events_.empty()) return std::nullopt;

    uint64_t front = events_.front().seq;
    if (after + 1 < front) {
        skipped = front - (after + 1);
        return events_.front();
    }
    uint64_t index = after + 1 - front;
    if (index >= events_.size()) return std::nullopt;
    return events_[index];
}

bool ChangeFeed::wait_for_after(uint64_t after, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return next_seq_ - 1 > after; });
}

// ── ChangeCursor ────────────────────────────────────────────

ChangeCursor::ChangeCursor(ChangeFeed& feed, uint64_t position)
    : feed_(&feed), position_(position) {}

std::optional<CacheEvent> ChangeCursor::next() {
    uint64_t skipped = 0;
    auto e = feed_->next_after(position_, skipped);
    if (!e) return std::nullopt;
    dropped_ += skipped;
    position_ = e->seq;
    return e;
}

std::optional<CacheEvent> ChangeCursor::wait_next(std::chrono::milliseconds timeout) {
    if (auto e = next()) return e;
    if (!feed_->wait_for_after(position_, timeout)) return std::nullopt;
    return next();
}

void ChangeCursor::restart() {
    uint64_t first = feed_->first_retained_seq();
    position_ = first == 0 ? 0 : first - 1;
    dropped_ = 0;
}

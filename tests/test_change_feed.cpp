#include <gtest/gtest.h>
#include <managers/change_feed.hpp>
#include <thread>

using namespace std::chrono_literals;

static CacheEvent ev(CacheEventKind kind, const std::string& id = "") {
    return CacheEvent{0, kind, "us-east-1", id, ""};
}

TEST(ChangeFeedTest, PublishAssignsIncreasingSequence) {
    ChangeFeed feed;
    feed.publish(ev(CacheEventKind::InstanceAdded, "a"));
    feed.publish({ev(CacheEventKind::InstanceAdded, "b"), ev(CacheEventKind::RegionRefreshed)});

    EXPECT_EQ(feed.last_seq(), 3u);

    auto cursor = feed.cursor();
    EXPECT_EQ(cursor.next()->seq, 1u);
    EXPECT_EQ(cursor.next()->instance_id, "b");
    EXPECT_EQ(cursor.next()->kind, CacheEventKind::RegionRefreshed);
    EXPECT_FALSE(cursor.next().has_value());
}

TEST(ChangeFeedTest, CursorIsLazyAndSeesLaterEvents) {
    ChangeFeed feed;
    auto cursor = feed.cursor();
    EXPECT_FALSE(cursor.next().has_value());

    feed.publish(ev(CacheEventKind::PinChanged, "a"));

    auto e = cursor.next();
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->kind, CacheEventKind::PinChanged);
}

TEST(ChangeFeedTest, CursorFromSequence) {
    ChangeFeed feed;
    for (int i = 0; i < 5; ++i) feed.publish(ev(CacheEventKind::InstanceUpdated, std::to_string(i)));

    auto cursor = feed.cursor(4);
    EXPECT_EQ(cursor.next()->instance_id, "3");
    EXPECT_EQ(cursor.next()->instance_id, "4");
    EXPECT_FALSE(cursor.next().has_value());

    auto future_only = feed.cursor(feed.last_seq() + 1);
    EXPECT_FALSE(future_only.next().has_value());
}

TEST(ChangeFeedTest, RestartReplaysRetainedEvents) {
    ChangeFeed feed;
    feed.publish(ev(CacheEventKind::InstanceAdded, "a"));
    feed.publish(ev(CacheEventKind::InstanceAdded, "b"));

    auto cursor = feed.cursor();
    while (cursor.next()) {}
    cursor.restart();

    EXPECT_EQ(cursor.next()->instance_id, "a");
}

TEST(ChangeFeedTest, RetentionDropsOldestAndCountsSkips) {
    ChangeFeed feed(3);
    auto cursor = feed.cursor();
    for (int i = 0; i < 5; ++i) feed.publish(ev(CacheEventKind::InstanceUpdated, std::to_string(i)));

    auto e = cursor.next();
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->instance_id, "2");
    EXPECT_EQ(cursor.dropped(), 2u);
}

TEST(ChangeFeedTest, WaitNextWakesOnPublish) {
    ChangeFeed feed;
    auto cursor = feed.cursor(feed.last_seq() + 1);

    std::thread publisher([&] {
        std::this_thread::sleep_for(20ms);
        feed.publish(ev(CacheEventKind::ScanCompleted));
    });
    auto e = cursor.wait_next(2s);
    publisher.join();

    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->kind, CacheEventKind::ScanCompleted);
}

TEST(ChangeFeedTest, WaitNextTimesOut) {
    ChangeFeed feed;
    auto cursor = feed.cursor();
    EXPECT_FALSE(cursor.wait_next(10ms).has_value());
}

TEST(ChangeFeedTest, SubscribersReceiveUntilUnsubscribed) {
    ChangeFeed feed;
    std::vector<std::string> seen;
    int id = feed.subscribe([&](const CacheEvent& e) { seen.push_back(e.instance_id); });

    feed.publish(ev(CacheEventKind::InstanceAdded, "a"));
    feed.unsubscribe(id);
    feed.publish(ev(CacheEventKind::InstanceAdded, "b"));

    EXPECT_EQ(seen, (std::vector<std::string>{"a"}));
}

TEST(ChangeFeedTest, SubscriberMayReadTheFeed) {
    ChangeFeed feed;
    uint64_t observed = 0;
    feed.subscribe([&](const CacheEvent&) { observed = feed.last_seq(); });

    feed.publish(ev(CacheEventKind::InstanceAdded, "a"));

    EXPECT_EQ(observed, 1u);
}

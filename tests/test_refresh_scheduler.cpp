#include <gtest/gtest.h>
#include <managers/refresh_scheduler.hpp>
#include "fake_compute_api.hpp"
#include <thread>

using namespace std::chrono_literals;

class RefreshSchedulerTest : public ::testing::Test {
protected:
    FakeComputeApi api;
    ChangeFeed feed;
    StateCache cache{feed, 60, 3};
    RegionCatalog catalog{api};
    InstanceFetcher fetcher{api, 5};

    std::unique_ptr<RefreshScheduler> make(std::chrono::milliseconds interval = 1h, int workers = 4) {
        SchedulerOptions opts;
        opts.interval = interval;
        opts.workers = workers;
        return std::make_unique<RefreshScheduler>(catalog, fetcher, cache, opts);
    }

    // Poll until `pred` holds or the timeout passes.
    template <typename Pred>
    static bool eventually(Pred pred, std::chrono::milliseconds timeout = 5s) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (pred()) return true;
            std::this_thread::sleep_for(5ms);
        }
        return pred();
    }
};

TEST_F(RefreshSchedulerTest, TickMergesEveryEnabledRegion) {
    api.put("us-east-1", "u1", InstanceState::Running);
    api.put("eu-west-1", "e1", InstanceState::Stopped);
    auto scheduler = make();

    auto report = scheduler->run_tick();

    EXPECT_FALSE(report.aborted);
    EXPECT_EQ(report.tick, 1u);
    EXPECT_EQ(report.succeeded(), 2);
    EXPECT_EQ(cache.read().size(), 2u);
    EXPECT_FALSE(cache.is_stale("us-east-1"));
    EXPECT_FALSE(cache.is_stale("eu-west-1"));
}

TEST_F(RefreshSchedulerTest, ManualRefreshJoinsScanInFlight) {
    api.put("us-east-1", "u1", InstanceState::Running);
    api.put("eu-west-1", "e1", InstanceState::Running);
    auto scheduler = make();

    api.hold_fetches();
    ScanReport first;
    std::thread ticker([&] { first = scheduler->run_tick(); });
    ASSERT_TRUE(api.wait_in_flight(1));
    EXPECT_TRUE(scheduler->scan_in_flight());

    auto joined = scheduler->manual_refresh();
    api.release_fetches();
    ticker.join();
    auto second = joined.get();

    EXPECT_EQ(first.tick, second.tick);
    EXPECT_EQ(api.describe_calls("us-east-1"), 1);
    EXPECT_EQ(api.describe_calls("eu-west-1"), 1);
    EXPECT_FALSE(scheduler->scan_in_flight());
}

TEST_F(RefreshSchedulerTest, FailedRegionIsIsolated) {
    api.put("us-east-1", "u1", InstanceState::Running);
    api.put("eu-west-1", "e1", InstanceState::Running);
    auto scheduler = make();
    scheduler->run_tick();

    api.fail_region("eu-west-1", ErrorKind::Network, "Could not connect to the endpoint URL");
    api.set_state("us-east-1", "u1", InstanceState::Stopped);
    auto cursor = feed.cursor(feed.last_seq() + 1);
    auto report = scheduler->run_tick();

    EXPECT_EQ(report.succeeded(), 1);
    EXPECT_EQ(report.failed(), 1);
    EXPECT_TRUE(cache.is_stale("eu-west-1"));
    EXPECT_FALSE(cache.is_stale("us-east-1"));
    EXPECT_EQ(cache.find("us-east-1", "u1")->state, InstanceState::Stopped);
    EXPECT_TRUE(cache.find("eu-west-1", "e1").has_value());

    bool warned = false;
    while (auto e = cursor.next()) {
        if (e->kind == CacheEventKind::RegionFailed && e->region == "eu-west-1") warned = true;
    }
    EXPECT_TRUE(warned);
}

TEST_F(RefreshSchedulerTest, StateTransitions) {
    auto scheduler = make();
    EXPECT_EQ(scheduler->state(), SchedulerState::Idle);

    scheduler->resume();
    EXPECT_EQ(scheduler->state(), SchedulerState::Idle);

    scheduler->start();
    EXPECT_EQ(scheduler->state(), SchedulerState::Scanning);

    scheduler->pause();
    EXPECT_EQ(scheduler->state(), SchedulerState::Paused);

    scheduler->resume();
    EXPECT_EQ(scheduler->state(), SchedulerState::Scanning);

    scheduler->set_auto_refresh(false);
    EXPECT_EQ(scheduler->state(), SchedulerState::Paused);
    scheduler->set_auto_refresh(true);
    EXPECT_EQ(scheduler->state(), SchedulerState::Scanning);
}

TEST_F(RefreshSchedulerTest, PeriodicTicksStopWhenPaused) {
    api.put("us-east-1", "u1", InstanceState::Running);
    auto scheduler = make(20ms);
    scheduler->start();

    ASSERT_TRUE(eventually([&] { return api.describe_calls("us-east-1") >= 2; }));

    scheduler->pause();
    ASSERT_TRUE(eventually([&] { return !scheduler->scan_in_flight(); }));
    int calls = api.describe_calls("us-east-1");
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(api.describe_calls("us-east-1"), calls);
}

TEST_F(RefreshSchedulerTest, PauseLetsScanInFlightCommit) {
    api.put("us-east-1", "u1", InstanceState::Running);
    auto scheduler = make();

    api.hold_fetches();
    std::thread ticker([&] { scheduler->run_tick(); });
    ASSERT_TRUE(api.wait_in_flight(1));

    scheduler->pause();
    api.release_fetches();
    ticker.join();

    EXPECT_TRUE(cache.find("us-east-1", "u1").has_value());
    EXPECT_FALSE(cache.is_stale("us-east-1"));
}

TEST_F(RefreshSchedulerTest, ManualRefreshWorksWhilePaused) {
    api.put("us-east-1", "u1", InstanceState::Running);
    auto scheduler = make();
    scheduler->pause();

    auto report = scheduler->manual_refresh().get();

    EXPECT_EQ(report.succeeded(), 1);
    EXPECT_EQ(scheduler->state(), SchedulerState::Paused);
}

TEST_F(RefreshSchedulerTest, FetchesBoundedByWorkerBudget) {
    for (int i = 0; i < 8; ++i) {
        api.put("region-" + std::to_string(i), "i-" + std::to_string(i), InstanceState::Running);
    }
    api.set_describe_delay(30ms);
    auto scheduler = make(1h, 3);

    auto report = scheduler->run_tick();

    EXPECT_EQ(report.succeeded(), 8);
    EXPECT_LE(api.max_concurrent(), 3);
    EXPECT_GE(api.max_concurrent(), 2);
}

TEST_F(RefreshSchedulerTest, AuthFailureFromListingHalts) {
    api.add_region("us-east-1");
    api.fail_listing(ErrorKind::Auth, "Unable to locate credentials");
    auto scheduler = make();
    scheduler->start();

    auto report = scheduler->run_tick();

    EXPECT_TRUE(report.aborted);
    EXPECT_EQ(report.abort_kind, ErrorKind::Auth);
    EXPECT_EQ(scheduler->state(), SchedulerState::Paused);
    EXPECT_FALSE(scheduler->halt_reason().empty());
    EXPECT_EQ(api.total_describe_calls(), 0);

    scheduler->resume();
    EXPECT_TRUE(scheduler->halt_reason().empty());
}

TEST_F(RefreshSchedulerTest, AuthFailureFromFetchHalts) {
    api.put("us-east-1", "u1", InstanceState::Running);
    api.fail_region("us-east-1", ErrorKind::Auth, "ExpiredToken");
    auto scheduler = make();
    scheduler->start();

    auto report = scheduler->run_tick();

    EXPECT_EQ(report.failed(), 1);
    EXPECT_EQ(report.regions[0].kind, ErrorKind::Auth);
    EXPECT_EQ(scheduler->state(), SchedulerState::Paused);
}

TEST_F(RefreshSchedulerTest, DisabledRegionsAreSkipped) {
    api.put("us-east-1", "u1", InstanceState::Running);
    api.put("eu-west-1", "e1", InstanceState::Running);
    auto scheduler = make();
    ASSERT_TRUE(catalog.list_regions().is_ok());
    ASSERT_TRUE(catalog.set_enabled("eu-west-1", false));

    scheduler->run_tick();

    EXPECT_EQ(api.describe_calls("us-east-1"), 1);
    EXPECT_EQ(api.describe_calls("eu-west-1"), 0);
}

TEST_F(RefreshSchedulerTest, ScanCompletedPublishedLast) {
    api.put("us-east-1", "u1", InstanceState::Running);
    auto scheduler = make();
    auto cursor = feed.cursor();

    scheduler->run_tick();

    std::optional<CacheEvent> last;
    while (auto e = cursor.next()) last = e;
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->kind, CacheEventKind::ScanCompleted);
}

TEST_F(RefreshSchedulerTest, ThrowingFetchFailsOnlyItsRegion) {
    api.put("us-east-1", "u1", InstanceState::Running);
    api.put("eu-west-1", "e1", InstanceState::Running);
    api.put("ap-south-1", "a1", InstanceState::Running);
    api.throw_on_describe("eu-west-1");
    auto scheduler = make(1h, 3);

    auto report = scheduler->run_tick();

    EXPECT_FALSE(report.aborted);
    EXPECT_EQ(report.succeeded(), 2);
    EXPECT_EQ(report.failed(), 1);
    for (const auto& r : report.regions) {
        if (r.region == "eu-west-1") {
            EXPECT_EQ(r.kind, ErrorKind::RegionUnavailable);
            EXPECT_NE(r.error.find("injected failure"), std::string::npos);
        }
    }
    EXPECT_TRUE(cache.is_stale("eu-west-1"));
    EXPECT_FALSE(cache.is_stale("us-east-1"));
    EXPECT_EQ(scheduler->state(), SchedulerState::Idle);
}

#include <gtest/gtest.h>
#include <managers/fleet_service.hpp>
#include "fake_compute_api.hpp"

class FleetServiceTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path state_path;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "ec2ctl_fleet_test";
        fs::remove_all(test_dir);
        state_path = test_dir / "state.yaml";
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    static Config manual_config() {
        auto r = Config::parse("refresh:\n  auto_refresh: false\n");
        return r.value;
    }

    // Service wired to a fresh fake; `api` points at the fake it owns.
    std::unique_ptr<FleetService> make_service(FakeComputeApi*& api) {
        auto fake = std::make_unique<FakeComputeApi>();
        fake->put("us-east-1", "i-web", InstanceState::Running, "web");
        fake->put("us-east-1", "i-batch", InstanceState::Stopped, "batch");
        fake->put("eu-west-1", "i-eu", InstanceState::Running, "eu");
        api = fake.get();
        return std::make_unique<FleetService>(manual_config(), std::move(fake), state_path);
    }
};

TEST_F(FleetServiceTest, InitThenRefreshPopulatesCache) {
    FakeComputeApi* api = nullptr;
    auto fleet = make_service(api);

    ASSERT_TRUE(fleet->init().is_ok());
    EXPECT_TRUE(fleet->is_initialized());
    EXPECT_EQ(fleet->scheduler_state(), SchedulerState::Idle);
    EXPECT_TRUE(fleet->read().empty());

    auto report = fleet->refresh_now();
    EXPECT_EQ(report.succeeded(), 2);
    EXPECT_EQ(fleet->read().size(), 3u);
    EXPECT_FALSE(fleet->is_stale("us-east-1"));
}

TEST_F(FleetServiceTest, CommandsBeforeInitFail) {
    FakeComputeApi* api = nullptr;
    auto fleet = make_service(api);

    EXPECT_TRUE(fleet->request_action("us-east-1", "i-web", InstanceAction::Stop).is_err());
    EXPECT_TRUE(fleet->set_pinned("us-east-1", "i-web", true).is_err());
    EXPECT_TRUE(fleet->refresh_now().aborted);
    EXPECT_TRUE(fleet->read().empty());
}

TEST_F(FleetServiceTest, AuthFailureAtInitIsFatal) {
    FakeComputeApi* api = nullptr;
    auto fleet = make_service(api);
    api->fail_listing(ErrorKind::Auth, "Unable to locate credentials");

    auto r = fleet->init();

    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Auth);
    EXPECT_FALSE(fleet->is_initialized());
}

TEST_F(FleetServiceTest, NetworkFailureAtInitStillStarts) {
    FakeComputeApi* api = nullptr;
    auto fleet = make_service(api);
    api->fail_listing(ErrorKind::Network, "Could not connect");

    EXPECT_TRUE(fleet->init().is_ok());
}

TEST_F(FleetServiceTest, SummariesCarryOverlayHint) {
    FakeComputeApi* api = nullptr;
    auto fleet = make_service(api);
    ASSERT_TRUE(fleet->init().is_ok());
    fleet->refresh_now();

    ASSERT_TRUE(fleet->request_action("us-east-1", "i-batch", InstanceAction::Start).is_ok());

    CacheFilter f;
    f.region = "us-east-1";
    auto rows = fleet->list_instances(f);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[1].id, "i-batch");
    EXPECT_EQ(rows[1].state, "pending");
    EXPECT_TRUE(rows[1].pending_action);
    EXPECT_FALSE(rows[1].stale);
    EXPECT_EQ(rows[1].public_ip, "-");
}

TEST_F(FleetServiceTest, PinsAndDataSurviveRestart) {
    {
        FakeComputeApi* api = nullptr;
        auto fleet = make_service(api);
        ASSERT_TRUE(fleet->init().is_ok());
        fleet->refresh_now();
        ASSERT_TRUE(fleet->set_pinned("eu-west-1", "i-eu", true).is_ok());
        fleet->teardown();
    }
    ASSERT_TRUE(fs::exists(state_path));

    FakeComputeApi* api = nullptr;
    auto fleet = make_service(api);
    ASSERT_TRUE(fleet->init().is_ok());

    // Restored before any fetch: pinned first, everything stale
    auto rows = fleet->list_instances();
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0].id, "i-eu");
    EXPECT_TRUE(rows[0].pinned);
    EXPECT_TRUE(rows[0].stale);
    EXPECT_TRUE(fleet->is_stale("us-east-1"));

    fleet->refresh_now();
    rows = fleet->list_instances();
    EXPECT_EQ(rows[0].id, "i-eu");
    EXPECT_FALSE(rows[0].stale);
}

TEST_F(FleetServiceTest, RegionToggle) {
    FakeComputeApi* api = nullptr;
    auto fleet = make_service(api);
    ASSERT_TRUE(fleet->init().is_ok());

    EXPECT_TRUE(fleet->set_region_enabled("eu-west-1", false).is_ok());
    EXPECT_EQ(fleet->set_region_enabled("xx-nowhere-1", false).kind, ErrorKind::Rejected);

    fleet->refresh_now();
    EXPECT_EQ(api->describe_calls("eu-west-1"), 0);

    auto regions = fleet->regions();
    ASSERT_TRUE(regions.is_ok());
    EXPECT_EQ(regions.value.size(), 2u);
}

TEST_F(FleetServiceTest, AutoRefreshToggle) {
    FakeComputeApi* api = nullptr;
    auto fleet = make_service(api);
    ASSERT_TRUE(fleet->init().is_ok());

    fleet->set_auto_refresh(true);
    EXPECT_EQ(fleet->scheduler_state(), SchedulerState::Scanning);
    fleet->set_auto_refresh(false);
    EXPECT_EQ(fleet->scheduler_state(), SchedulerState::Paused);
}

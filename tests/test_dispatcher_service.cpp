#include <gtest/gtest.h>
#include "dispatcher_service.hpp"
#include "test_common.hpp"

using namespace dispatch;
using dispatch::test::make_profile;

class DispatcherServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        service = std::make_unique<DispatcherService>();
        ASSERT_TRUE(service->set_profile(
            make_profile("DSP1", kMetaWeight, {{"A", 10}, {"B", 20}, {"C", 20}})).has_value());
    }

    std::unique_ptr<DispatcherService> service;
};

TEST_F(DispatcherServiceTest, InitialState) {
    EXPECT_EQ(service->profile_count(), 1);
    EXPECT_TRUE(service->has_profile("example.org", "DSP1"));
    EXPECT_FALSE(service->has_profile("example.org", "DSP2"));
    EXPECT_FALSE(service->has_profile("other.org", "DSP1"));
}

TEST_F(DispatcherServiceTest, InstancesStartAtHighestWeight) {
    for (int i = 0; i < 3; ++i) {
        auto instance = service->get_instance("example.org", "DSP1");
        ASSERT_TRUE(instance.has_value());
        EXPECT_EQ(instance.value()->next_conn_id(), "B");
    }
}

TEST_F(DispatcherServiceTest, UnknownProfile) {
    auto instance = service->get_instance("example.org", "missing");
    ASSERT_FALSE(instance.has_value());
    EXPECT_EQ(instance.error().code, ErrorCode::ProfileNotFound);
}

TEST_F(DispatcherServiceTest, ReconfigureSameStrategy) {
    ASSERT_TRUE(service->set_profile(
        make_profile("DSP1", kMetaWeight, {{"X", 1}, {"Y", 5}})).has_value());

    EXPECT_EQ(service->profile_count(), 1);
    auto instance = service->get_instance("example.org", "DSP1");
    ASSERT_TRUE(instance.has_value());
    EXPECT_EQ(instance.value()->max_conns(), 2);
    EXPECT_EQ(instance.value()->next_conn_id(), "Y");
}

TEST_F(DispatcherServiceTest, ReconfigureSwitchesStrategy) {
    ASSERT_TRUE(service->set_profile(
        make_profile("DSP1", kMetaRoundRobin, {{"A", 10}, {"B", 20}})).has_value());

    auto first = service->get_instance("example.org", "DSP1");
    auto second = service->get_instance("example.org", "DSP1");
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first.value()->strategy(), Strategy::RoundRobin);
    EXPECT_EQ(first.value()->next_conn_id(), "B");
    EXPECT_EQ(second.value()->next_conn_id(), "A");

    auto profiles = service->profiles();
    ASSERT_EQ(profiles.size(), 1);
    EXPECT_EQ(profiles[0].strategy, kMetaRoundRobin);
}

TEST_F(DispatcherServiceTest, RejectedProfileKeepsPrevious) {
    auto result = service->set_profile(make_profile("DSP1", "*unknown", {{"X", 1}}));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::UnsupportedStrategy);

    result = service->set_profile(make_profile("DSP1", kMetaWeight, {}));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::EmptyPool);

    auto instance = service->get_instance("example.org", "DSP1");
    ASSERT_TRUE(instance.has_value());
    EXPECT_EQ(instance.value()->max_conns(), 3);
}

TEST_F(DispatcherServiceTest, UnsupportedStrategyNotInstalled) {
    auto result = service->set_profile(make_profile("DSP2", "*unknown", {{"X", 1}}));
    ASSERT_FALSE(result.has_value());
    EXPECT_FALSE(service->has_profile("example.org", "DSP2"));
}

TEST_F(DispatcherServiceTest, RemoveProfile) {
    EXPECT_TRUE(service->remove_profile("example.org", "DSP1"));
    EXPECT_FALSE(service->remove_profile("example.org", "DSP1"));
    EXPECT_EQ(service->profile_count(), 0);
}

TEST_F(DispatcherServiceTest, DispatchFirstSuccess) {
    std::vector<std::string> tried;
    auto served = service->dispatch("example.org", "DSP1", [&](const std::string& conn_id) {
        tried.push_back(conn_id);
        return true;
    });

    ASSERT_TRUE(served.has_value());
    EXPECT_EQ(served.value(), "B");
    EXPECT_EQ(tried.size(), 1);
}

TEST_F(DispatcherServiceTest, DispatchFailsOver) {
    std::vector<std::string> tried;
    auto served = service->dispatch("example.org", "DSP1", [&](const std::string& conn_id) {
        tried.push_back(conn_id);
        return conn_id == "A";
    });

    ASSERT_TRUE(served.has_value());
    EXPECT_EQ(served.value(), "A");
    std::vector<std::string> expected = {"B", "C", "A"};
    EXPECT_EQ(tried, expected);
}

TEST_F(DispatcherServiceTest, DispatchExhaustsPool) {
    int attempts = 0;
    auto served = service->dispatch("example.org", "DSP1", [&](const std::string&) {
        ++attempts;
        return false;
    });

    ASSERT_FALSE(served.has_value());
    EXPECT_EQ(served.error().code, ErrorCode::NoConnectionAvailable);
    EXPECT_EQ(attempts, 3);
}

TEST_F(DispatcherServiceTest, DispatchUnknownProfile) {
    auto served = service->dispatch("example.org", "missing", [](const std::string&) {
        return true;
    });

    ASSERT_FALSE(served.has_value());
    EXPECT_EQ(served.error().code, ErrorCode::ProfileNotFound);
}

#include <gtest/gtest.h>
#include "admin_api.hpp"
#include "test_common.hpp"
#include <nlohmann/json.hpp>

using namespace dispatch;
using dispatch::test::make_profile;
using json = nlohmann::json;

class AdminApiTest : public ::testing::Test {
protected:
    void SetUp() override {
        service = std::make_shared<DispatcherService>();
        ASSERT_TRUE(service->set_profile(
            make_profile("DSP1", kMetaWeight, {{"A", 10}, {"B", 20}, {"C", 20}})).has_value());
        api = std::make_unique<AdminApi>(service);
    }

    std::shared_ptr<DispatcherService> service;
    std::unique_ptr<AdminApi> api;
};

TEST_F(AdminApiTest, RouteReturnsCandidatesInOrder) {
    auto res = api->route("example.org", "DSP1");
    ASSERT_EQ(res.status, 200);

    auto body = json::parse(res.body);
    EXPECT_EQ(body["strategy"], "*weight");
    std::vector<std::string> candidates = body["candidates"];
    std::vector<std::string> expected = {"B", "C", "A"};
    EXPECT_EQ(candidates, expected);
}

TEST_F(AdminApiTest, RouteUnknownProfile) {
    auto res = api->route("example.org", "missing");
    EXPECT_EQ(res.status, 404);
    EXPECT_TRUE(json::parse(res.body).contains("error"));
}

TEST_F(AdminApiTest, PutProfileReconfigures) {
    auto res = api->put_profile(R"({
        "tenant": "example.org", "id": "DSP1", "strategy": "*weight",
        "connections": [{"id": "X", "weight": 1}, {"id": "Y", "weight": 2}]
    })");
    ASSERT_EQ(res.status, 200);

    auto route = json::parse(api->route("example.org", "DSP1").body);
    std::vector<std::string> candidates = route["candidates"];
    std::vector<std::string> expected = {"Y", "X"};
    EXPECT_EQ(candidates, expected);
}

TEST_F(AdminApiTest, PutProfileRejectsUnsupportedStrategy) {
    auto res = api->put_profile(R"({
        "id": "DSP2", "strategy": "*load", "connections": [{"id": "X"}]
    })");
    EXPECT_EQ(res.status, 400);
    EXPECT_FALSE(service->has_profile("default", "DSP2"));
}

TEST_F(AdminApiTest, PutProfileRejectsBadJson) {
    EXPECT_EQ(api->put_profile("not json").status, 400);
}

TEST_F(AdminApiTest, ListAndDelete) {
    auto list = json::parse(api->list_profiles().body);
    ASSERT_EQ(list.size(), 1);
    EXPECT_EQ(list[0]["id"], "DSP1");

    EXPECT_EQ(api->delete_profile("example.org", "DSP1").status, 200);
    EXPECT_EQ(api->delete_profile("example.org", "DSP1").status, 404);
    EXPECT_EQ(json::parse(api->list_profiles().body).size(), 0);
}

TEST_F(AdminApiTest, ErrorBodiesCarryCode) {
    auto missing = json::parse(api->route("example.org", "missing").body);
    EXPECT_EQ(missing["code"], "ProfileNotFound");

    auto unsupported = json::parse(api->put_profile(R"({
        "id": "DSP2", "strategy": "*load", "connections": [{"id": "X"}]
    })").body);
    EXPECT_EQ(unsupported["code"], "UnsupportedStrategy");

    auto deleted = json::parse(api->delete_profile("example.org", "nope").body);
    EXPECT_EQ(deleted["code"], "ProfileNotFound");
}

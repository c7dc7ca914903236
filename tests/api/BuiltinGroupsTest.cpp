#include "api/BuiltinGroups.h"
#include "mocks/MockHttpClient.h"
#include "reporting/ResultAggregator.h"
#include "scheduling/TestScheduler.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace TOE {
namespace Test {

using ::testing::_;
using ::testing::ElementsAre;
using ::testing::NiceMock;

class BuiltinGroupsTest : public ::testing::Test {
protected:
    void SetUp() override {
        http_ = std::make_shared<NiceMock<MockHttpClient>>();
        registerBuiltinGroups(registry_, http_, Credentials{"admin", "admin123"});
        run_.session().baseUrl = "http://127.0.0.1:3498";
    }

    std::shared_ptr<NiceMock<MockHttpClient>> http_;
    TestRegistry registry_;
    RunContext run_;
};

TEST_F(BuiltinGroupsTest, RegistersStandardGroupsInOrder) {
    EXPECT_THAT(registry_.names(), ElementsAre("health", "auth", "projects", "collections", "documents", "cors"));
    EXPECT_EQ(registry_.expectedTestCount(), 19);
    EXPECT_THAT(registry_.resolveTestDependencies({"documents"}),
                ElementsAre("auth", "projects", "collections", "documents"));
    EXPECT_FALSE(registry_.requirementsOf("health").any());
    EXPECT_TRUE(registry_.requirementsOf("cors").needsAuth);
    EXPECT_TRUE(registry_.requirementsOf("documents").needsCollection);
}

TEST_F(BuiltinGroupsTest, HealthGroupPassesAgainstHealthyTarget) {
    ON_CALL(*http_, sendRequest(_)).WillByDefault(Respond(MockHttpClient::status(200, R"({"status":"ok"})")));

    ResultAggregator aggregator(0, nullptr);
    TestScheduler scheduler(registry_, run_, aggregator);
    auto summary = scheduler.run(std::vector<std::string>{"health"});

    EXPECT_EQ(summary.passed, 2);
    EXPECT_EQ(summary.failed, 0);
}

TEST_F(BuiltinGroupsTest, HealthGroupFailuresAreClassified) {
    ON_CALL(*http_, sendRequest(_)).WillByDefault(Respond(MockHttpClient::refused()));

    ResultAggregator aggregator(0, nullptr);
    TestScheduler scheduler(registry_, run_, aggregator);
    auto summary = scheduler.run(std::vector<std::string>{"health"});

    EXPECT_EQ(summary.failed, 2);
    for (const auto &outcome : aggregator.outcomes()) {
        EXPECT_EQ(outcome.classification.source, ErrorSource::NETWORK);
        EXPECT_EQ(outcome.classification.fixLocation, FixLocation::BACKEND);
    }
}

}  // namespace Test
}  // namespace TOE

#include "scheduling/TestSelector.h"
#include "common/HarnessErrors.h"
#include "common/TestUtils.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace TOE {
namespace Test {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

class TestSelectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char *name : {"health", "auth", "projects", "documents"}) {
            TestGroup group;
            group.name = name;
            registry_.add(group);
        }
    }

    void writePreviousRun(const std::string &json) {
        reports_.write("test-results-2025-01-01T00-00-00-000Z.json", json);
    }

    TestRegistry registry_;
    Utils::TempDirectory reports_;
};

TEST_F(TestSelectorTest, NothingSelectedRunsAll) {
    TestSelector selector(registry_, reports_.path());
    EXPECT_FALSE(selector.select({}).has_value());
}

TEST_F(TestSelectorTest, OnlyIsPassedThrough) {
    TestSelector selector(registry_, reports_.path());
    SelectionOptions options;
    options.only = {"projects", "health"};

    auto selection = selector.select(options);
    ASSERT_TRUE(selection.has_value());
    EXPECT_THAT(*selection, ElementsAre("projects", "health"));
}

TEST_F(TestSelectorTest, UnknownNameListsAvailableGroups) {
    TestSelector selector(registry_, reports_.path());
    SelectionOptions options;
    options.only = {"ghost"};

    try {
        selector.select(options);
        FAIL() << "Expected ConfigurationException";
    } catch (const ConfigurationException &e) {
        EXPECT_THAT(e.what(), HasSubstr("ghost"));
        EXPECT_THAT(e.what(), HasSubstr("documents"));
    }

    options.only.clear();
    options.skip = {"phantom"};
    EXPECT_THROW(selector.select(options), ConfigurationException);
}

TEST_F(TestSelectorTest, OnlyFailingReadsPreviousReport) {
    writePreviousRun(R"({
        "tests": [
            {"group": "health", "name": "ping", "status": "PASSED"},
            {"group": "documents", "name": "create", "status": "FAILED"},
            {"group": "removed", "name": "old", "status": "FAILED"}
        ],
        "suiteFailures": [{"group": "auth", "message": "boom"}]
    })");

    TestSelector selector(registry_, reports_.path());
    SelectionOptions options;
    options.onlyFailing = true;

    auto selection = selector.select(options);
    ASSERT_TRUE(selection.has_value());
    EXPECT_THAT(*selection, ElementsAre("documents", "auth"));
}

TEST_F(TestSelectorTest, OnlyFailingWithCleanHistoryRunsAll) {
    writePreviousRun(R"({"tests": [{"group": "health", "name": "ping", "status": "PASSED"}]})");

    TestSelector selector(registry_, reports_.path());
    SelectionOptions options;
    options.onlyFailing = true;
    EXPECT_FALSE(selector.select(options).has_value());
}

TEST_F(TestSelectorTest, OnlyTakesPrecedenceOverOnlyFailing) {
    writePreviousRun(R"({"tests": [{"group": "documents", "name": "x", "status": "FAILED"}]})");

    TestSelector selector(registry_, reports_.path());
    SelectionOptions options;
    options.only = {"health"};
    options.onlyFailing = true;

    auto selection = selector.select(options);
    ASSERT_TRUE(selection.has_value());
    EXPECT_THAT(*selection, ElementsAre("health"));
}

TEST_F(TestSelectorTest, SkipAppliesLast) {
    TestSelector selector(registry_, reports_.path());
    SelectionOptions options;
    options.skip = {"auth", "documents"};

    auto selection = selector.select(options);
    ASSERT_TRUE(selection.has_value());
    EXPECT_THAT(*selection, ElementsAre("health", "projects"));

    options.only = {"health", "auth"};
    selection = selector.select(options);
    ASSERT_TRUE(selection.has_value());
    EXPECT_THAT(*selection, ElementsAre("health"));
}

TEST_F(TestSelectorTest, SkippingEverythingIsAnError) {
    TestSelector selector(registry_, reports_.path());
    SelectionOptions options;
    options.only = {"health"};
    options.skip = {"health"};
    EXPECT_THROW(selector.select(options), ConfigurationException);
}

}  // namespace Test
}  // namespace TOE

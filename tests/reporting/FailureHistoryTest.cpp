#include "reporting/FailureHistory.h"
#include "common/TestUtils.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace TOE {
namespace Test {

using ::testing::ElementsAre;

TEST(FailureHistoryTest, MissingDirectoryHasNoHistory) {
    FailureHistory history("/nonexistent/toe-reports");
    EXPECT_FALSE(history.latestReport().has_value());
    EXPECT_TRUE(history.failedGroups().empty());
}

TEST(FailureHistoryTest, NewestReportWins) {
    Utils::TempDirectory dir;
    auto older = dir.write("test-results-2025-01-01T00-00-00-000Z.json",
                           R"({"tests": [{"group": "auth", "status": "FAILED"}]})");
    auto newer = dir.write("test-results-2025-01-02T00-00-00-000Z.json",
                           R"({"tests": [{"group": "projects", "status": "FAILED"}]})");
    dir.write("test-errors-2025-01-03T00-00-00-000Z.txt", "not a report");

    auto now = std::filesystem::file_time_type::clock::now();
    std::filesystem::last_write_time(older, now - std::chrono::hours(1));
    std::filesystem::last_write_time(newer, now);

    FailureHistory history(dir.path());
    ASSERT_TRUE(history.latestReport().has_value());
    EXPECT_EQ(*history.latestReport(), newer);
    EXPECT_THAT(history.failedGroups(), ElementsAre("projects"));
}

TEST(FailureHistoryTest, EqualTimestampsFallBackToName) {
    Utils::TempDirectory dir;
    auto first = dir.write("test-results-2025-01-01T00-00-00-000Z.json", "{}");
    auto second = dir.write("test-results-2025-01-01T00-00-00-000Z-1.json", "{}");
    auto stamp = std::filesystem::file_time_type::clock::now();
    std::filesystem::last_write_time(first, stamp);
    std::filesystem::last_write_time(second, stamp);

    FailureHistory history(dir.path());
    ASSERT_TRUE(history.latestReport().has_value());
    EXPECT_EQ(*history.latestReport(), second);
}

TEST(FailureHistoryTest, CollectsFailedTestsAndSuiteFailuresOnce) {
    Utils::TempDirectory dir;
    auto report = dir.write("report.json", R"({
        "tests": [
            {"group": "documents", "status": "FAILED"},
            {"group": "health", "status": "PASSED"},
            {"group": "documents", "status": "FAILED"}
        ],
        "suiteFailures": [{"group": "cors"}, {"group": "documents"}]
    })");

    EXPECT_THAT(FailureHistory::failedGroupsIn(report), ElementsAre("documents", "cors"));
}

TEST(FailureHistoryTest, UnreadableReportYieldsNothing) {
    Utils::TempDirectory dir;
    auto report = dir.write("test-results-broken.json", "{ not json");
    EXPECT_TRUE(FailureHistory::failedGroupsIn(report).empty());
}

}  // namespace Test
}  // namespace TOE

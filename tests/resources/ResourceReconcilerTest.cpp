#include "resources/ResourceReconciler.h"
#include "common/TestUtils.h"
#include <gtest/gtest.h>

#include <algorithm>

namespace TOE {
namespace Test {

namespace fs = std::filesystem;

class ResourceReconcilerTest : public ::testing::Test {
protected:
    ResourceReconciler::Options fastOptions() const {
        auto options = ResourceReconciler::defaultOptions(dir_.path());
        options.filePolicy = RetryPolicy{3, std::chrono::milliseconds(1), 2.0, std::chrono::milliseconds(4)};
        options.directoryPolicy = RetryPolicy{3, std::chrono::milliseconds(1), 1.5, std::chrono::milliseconds(4)};
        options.sleeper = sleeper_;
        return options;
    }

    static bool containsPath(const std::vector<std::string> &paths, const fs::path &path) {
        return std::find(paths.begin(), paths.end(), path.string()) != paths.end();
    }

    Utils::TempDirectory dir_;
    Utils::CountingSleeper sleeper_;
};

TEST_F(ResourceReconcilerTest, DatabaseTargetRemovesWalSiblings) {
    auto db = dir_.write("krapi_main.db");
    auto wal = dir_.write("krapi_main.db-wal");
    auto shm = dir_.write("krapi_main.db-shm");

    ResourceReconciler reconciler(fastOptions());
    auto report = reconciler.reconcile({CleanupTarget::database(db)});

    EXPECT_FALSE(fs::exists(db));
    EXPECT_FALSE(fs::exists(wal));
    EXPECT_FALSE(fs::exists(shm));
    EXPECT_EQ(report.removed.size(), 3u);
    EXPECT_TRUE(report.clean());
}

TEST_F(ResourceReconcilerTest, DefaultTargetsReachBaselineAndSecondPassIsNoop) {
    dir_.write("krapi_main.db");
    dir_.write("krapi.db-wal");
    dir_.write("projects/p1.db");
    dir_.write("projects/p2/data.db");
    dir_.write("backups/restic-repo/config");

    ResourceReconciler reconciler(fastOptions());
    auto first = reconciler.reconcile(ResourceReconciler::defaultTargets(dir_.path()));

    EXPECT_TRUE(first.clean());
    EXPECT_FALSE(first.removed.empty());
    EXPECT_FALSE(fs::exists(dir_.path() / "krapi_main.db"));
    EXPECT_FALSE(fs::exists(dir_.path() / "krapi.db-wal"));
    EXPECT_TRUE(CleanupTarget::entriesOf(dir_.path() / "projects").empty());
    EXPECT_TRUE(fs::is_directory(dir_.path() / "projects"));
    EXPECT_FALSE(fs::exists(dir_.path() / "backups" / "restic-repo"));

    auto second = reconciler.reconcile(ResourceReconciler::defaultTargets(dir_.path()));
    EXPECT_TRUE(second.removed.empty());
    EXPECT_TRUE(second.clean());
    EXPECT_EQ(sleeper_.calls->load(), 0);
}

TEST_F(ResourceReconcilerTest, MissingPathsAreNotErrors) {
    ResourceReconciler reconciler(fastOptions());
    auto report = reconciler.reconcile({CleanupTarget::file(dir_.path() / "absent.db"),
                                        CleanupTarget::directory(dir_.path() / "absent-dir")});
    EXPECT_TRUE(report.clean());
    EXPECT_TRUE(report.removed.empty());
    EXPECT_EQ(report.targetsVisited, 2);
}

TEST_F(ResourceReconcilerTest, UndeletablePathBecomesWarningAfterRetries) {
    // A directory removed as a plain file fails with "directory not empty" on every attempt
    auto stubborn = dir_.path() / "stubborn";
    dir_.write("stubborn/inner.txt");
    auto other = dir_.write("other.db");

    auto options = fastOptions();
    options.sweepDirectories.clear();
    options.verifyDirectories.clear();
    ResourceReconciler reconciler(options);
    auto report = reconciler.reconcile({CleanupTarget::file(stubborn), CleanupTarget::file(other)});

    ASSERT_EQ(report.warnings.size(), 1u);
    EXPECT_EQ(report.warnings[0].path, stubborn.string());
    EXPECT_EQ(report.warnings[0].attempts, 3);
    EXPECT_TRUE(fs::exists(stubborn));
    EXPECT_FALSE(report.clean());

    // The failure did not abort the pass
    EXPECT_FALSE(fs::exists(other));
    EXPECT_TRUE(containsPath(report.removed, other));
}

TEST_F(ResourceReconcilerTest, VerificationReportsLeftoverDatabases) {
    auto untracked = dir_.write("unexpected.db");

    ResourceReconciler reconciler(fastOptions());
    auto report = reconciler.reconcile({});

    ASSERT_EQ(report.leftovers.size(), 1u);
    EXPECT_EQ(report.leftovers[0], untracked.string());
    EXPECT_FALSE(report.clean());
}

TEST_F(ResourceReconcilerTest, RequiredDirectoriesAreCreated) {
    auto options = fastOptions();
    options.requiredDirectories = {dir_.path() / "data" / "projects"};
    ResourceReconciler reconciler(options);

    reconciler.reconcile({});
    EXPECT_TRUE(fs::is_directory(dir_.path() / "data" / "projects"));
}

TEST_F(ResourceReconcilerTest, RequiredDirectoryBlockedByFileThrows) {
    dir_.write("blocked", "not a directory");
    auto options = fastOptions();
    options.requiredDirectories = {dir_.path() / "blocked" / "child"};
    ResourceReconciler reconciler(options);

    EXPECT_THROW(reconciler.reconcile({}), SetupException);
}

TEST_F(ResourceReconcilerTest, DatabasePatternMatching) {
    EXPECT_TRUE(ResourceReconciler::matchesDatabasePattern("krapi_main.db"));
    EXPECT_TRUE(ResourceReconciler::matchesDatabasePattern("project.db-wal"));
    EXPECT_TRUE(ResourceReconciler::matchesDatabasePattern("project.db-shm"));
    EXPECT_FALSE(ResourceReconciler::matchesDatabasePattern("notes.dbx"));
    EXPECT_FALSE(ResourceReconciler::matchesDatabasePattern("readme.md"));
}

TEST_F(ResourceReconcilerTest, WarningStreakPersistsAcrossInstances) {
    auto stateFile = dir_.path() / "reports" / ".cleanup-warnings";

    CleanupWarningStreak first(stateFile);
    EXPECT_EQ(first.current(), 0);
    EXPECT_EQ(first.record(false), 1);
    EXPECT_EQ(first.record(false), 2);

    CleanupWarningStreak second(stateFile);
    EXPECT_EQ(second.current(), 2);
    EXPECT_EQ(second.record(true), 0);
    EXPECT_EQ(CleanupWarningStreak(stateFile).current(), 0);
}

}  // namespace Test
}  // namespace TOE

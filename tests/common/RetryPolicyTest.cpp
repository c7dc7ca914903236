#include "common/RetryPolicy.h"
#include "common/TestUtils.h"
#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

namespace TOE {
namespace Test {

class RetryPolicyTest : public ::testing::Test {
protected:
    RetryPolicy quickPolicy(int attempts) {
        RetryPolicy policy;
        policy.maxAttempts = attempts;
        policy.baseDelay = std::chrono::milliseconds(100);
        policy.factor = 2.0;
        policy.maxDelay = std::chrono::milliseconds(350);
        return policy;
    }

    std::vector<std::chrono::milliseconds> delays;
    RetrySleeper recordDelays() {
        return [this](std::chrono::milliseconds delay) { delays.push_back(delay); };
    }
};

TEST_F(RetryPolicyTest, DelayGrowsExponentiallyUpToCap) {
    auto policy = quickPolicy(5);
    EXPECT_EQ(policy.delayAfter(1).count(), 100);
    EXPECT_EQ(policy.delayAfter(2).count(), 200);
    EXPECT_EQ(policy.delayAfter(3).count(), 350);
    EXPECT_EQ(policy.delayAfter(10).count(), 350);
}

TEST_F(RetryPolicyTest, PresetsMatchDeletionBudgets) {
    auto files = RetryPolicy::forFileDeletion();
    EXPECT_EQ(files.maxAttempts, 10);
    EXPECT_EQ(files.maxDelay.count(), 10000);

    auto directories = RetryPolicy::forDirectoryDeletion();
    EXPECT_DOUBLE_EQ(directories.factor, 1.5);
    EXPECT_EQ(directories.maxDelay.count(), 15000);

#ifndef _WIN32
    EXPECT_EQ(files.baseDelay.count(), 1000);
    EXPECT_EQ(directories.maxAttempts, 8);
#endif
}

TEST_F(RetryPolicyTest, SucceedsWithoutSleepingOnFirstAttempt) {
    auto outcome = Retry::run(quickPolicy(3), [](std::string &) { return true; }, {}, recordDelays());
    EXPECT_TRUE(outcome.succeeded);
    EXPECT_EQ(outcome.attempts, 1);
    EXPECT_TRUE(delays.empty());
}

TEST_F(RetryPolicyTest, SleepsBetweenAttemptsButNotAfterLast) {
    int calls = 0;
    auto outcome = Retry::run(
        quickPolicy(3),
        [&calls](std::string &error) {
            calls++;
            error = "locked";
            return false;
        },
        {}, recordDelays());

    EXPECT_FALSE(outcome.succeeded);
    EXPECT_EQ(outcome.attempts, 3);
    EXPECT_EQ(outcome.lastError, "locked");
    EXPECT_EQ(calls, 3);
    ASSERT_EQ(delays.size(), 2u);
    EXPECT_EQ(delays[0].count(), 100);
    EXPECT_EQ(delays[1].count(), 200);
}

TEST_F(RetryPolicyTest, ExceptionsCountAsFailedAttempts) {
    int calls = 0;
    auto outcome = Retry::run(
        quickPolicy(3),
        [&calls](std::string &) -> bool {
            if (++calls < 2) {
                throw std::runtime_error("EBUSY");
            }
            return true;
        },
        {}, recordDelays());

    EXPECT_TRUE(outcome.succeeded);
    EXPECT_EQ(outcome.attempts, 2);
}

TEST_F(RetryPolicyTest, BusyProbeSkipsTheOperation) {
    int operations = 0;
    int probes = 0;
    auto outcome = Retry::run(
        quickPolicy(4),
        [&operations](std::string &) {
            operations++;
            return operations > 1;
        },
        [&probes] { return ++probes >= 2; }, recordDelays());

    // attempt 1 fails, attempt 2 probe busy, attempt 3 probe free and succeeds
    EXPECT_TRUE(outcome.succeeded);
    EXPECT_EQ(outcome.attempts, 3);
    EXPECT_EQ(operations, 2);
    EXPECT_EQ(probes, 2);
}

}  // namespace Test
}  // namespace TOE

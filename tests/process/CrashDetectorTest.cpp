#include "process/CrashDetector.h"
#include "process/OutputChannel.h"
#include "common/TestUtils.h"
#include <gtest/gtest.h>

#include <thread>

namespace TOE {
namespace Test {

TEST(CrashDetectorTest, DetectsFatalSignatures) {
    CrashDetector detector;
    auto match = detector.scan("SqliteError: UNIQUE constraint failed: projects.name");
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(*match, "UNIQUE constraint failed");

    EXPECT_TRUE(detector.scan("Error: Cannot find module './routes'").has_value());
    EXPECT_TRUE(detector.scan("Error: listen EADDRINUSE: address already in use :::3470").has_value());
    EXPECT_FALSE(detector.scan("Server listening on port 3470").has_value());
}

TEST(CrashDetectorTest, CustomSignaturesReplaceDefaults) {
    CrashDetector detector({"PANIC"});
    EXPECT_TRUE(detector.scan("kernel PANIC").has_value());
    EXPECT_FALSE(detector.scan("TypeError: x is undefined").has_value());
}

TEST(CrashDetectorTest, HarmlessAndImportantLines) {
    EXPECT_TRUE(CrashDetector::isHarmless("(node:1) ExperimentalWarning: VM Modules"));
    EXPECT_TRUE(CrashDetector::isHarmless("npm warn config production Use `--omit=dev` instead."));
    EXPECT_FALSE(CrashDetector::isHarmless("npm warn error something broke"));

    EXPECT_TRUE(CrashDetector::isImportant("[AUTH DEBUG] validateSessionToken"));
    EXPECT_TRUE(CrashDetector::isImportant("SQLITE_ERROR: no such table: users"));
    EXPECT_FALSE(CrashDetector::isImportant("GET /api/health 200 3ms"));
}

TEST(OutputChannelTest, PreservesOrderAndDrainsAfterClose) {
    OutputChannel channel(4);
    ASSERT_TRUE(channel.push({OutputStream::Stdout, "one", {}}));
    ASSERT_TRUE(channel.push({OutputStream::Stderr, "two", {}}));
    channel.close();

    EXPECT_FALSE(channel.push({OutputStream::Stdout, "late", {}}));
    auto first = channel.pop(Utils::STANDARD_WAIT_MS);
    auto second = channel.pop(Utils::STANDARD_WAIT_MS);
    ASSERT_TRUE(first && second);
    EXPECT_EQ(first->text, "one");
    EXPECT_EQ(second->stream, OutputStream::Stderr);
    EXPECT_FALSE(channel.pop(Utils::STANDARD_WAIT_MS).has_value());
    EXPECT_TRUE(channel.drained());
}

TEST(OutputChannelTest, FullChannelBlocksInsteadOfDropping) {
    OutputChannel channel(2);
    const int total = 200;

    std::thread producer([&channel] {
        for (int i = 0; i < total; ++i) {
            channel.push({OutputStream::Stdout, std::to_string(i), {}});
        }
        channel.close();
    });

    int received = 0;
    bool ordered = true;
    while (!channel.drained()) {
        auto line = channel.pop(Utils::STANDARD_WAIT_MS);
        if (line) {
            ordered = ordered && line->text == std::to_string(received);
            received++;
            EXPECT_LE(channel.size(), channel.capacity());
        }
    }
    producer.join();

    EXPECT_EQ(received, total);
    EXPECT_TRUE(ordered);
}

TEST(OutputChannelTest, PopTimesOutWhenEmpty) {
    OutputChannel channel;
    EXPECT_FALSE(channel.pop(std::chrono::milliseconds(20)).has_value());
    EXPECT_FALSE(channel.drained());
}

}  // namespace Test
}  // namespace TOE

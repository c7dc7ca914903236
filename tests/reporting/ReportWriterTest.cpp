#include "reporting/ReportWriter.h"
#include "common/TestUtils.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace TOE {
namespace Test {

using ::testing::HasSubstr;
using ::testing::Not;

namespace {

std::string readFile(const std::string &path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

TestOutcome passedOutcome(const std::string &group, const std::string &name) {
    TestOutcome outcome;
    outcome.group = group;
    outcome.name = name;
    outcome.status = TestStatus::Passed;
    outcome.timestamp = "2025-01-01T00:00:00.000Z";
    return outcome;
}

TestOutcome failedOutcome(const std::string &group, const std::string &name, ErrorSource source) {
    TestOutcome outcome = passedOutcome(group, name);
    outcome.status = TestStatus::Failed;
    outcome.message = name + " broke";
    outcome.classification.source = source;
    outcome.classification.category = ErrorCategory::SERVER_ERROR;
    outcome.classification.fixLocation = FixLocation::BACKEND;

    TestErrorInfo error;
    error.message = outcome.message;
    error.code = "INTERNAL_ERROR";
    error.httpStatus = 500;
    error.derivedStatus = 500;
    error.method = "GET";
    error.url = "http://127.0.0.1:3470/x";
    outcome.error = error;
    return outcome;
}

RunReport sampleReport() {
    RunReport report;
    report.outcomes = {passedOutcome("health", "ping"), failedOutcome("projects", "create", ErrorSource::SERVER),
                       failedOutcome("auth", "login", ErrorSource::NETWORK)};
    report.passed = 1;
    report.failed = 2;
    report.total = 3;
    report.expectedTotal = 5;
    report.successRate = 20.0;
    report.suiteFailures.push_back({SuiteFailure{"cors", "fixture exploded"}, "2025-01-01T00:00:01.000Z"});
    report.environment = {{"backendUrl", "http://127.0.0.1:3470"}};
    return report;
}

}  // namespace

TEST(ReportWriterTest, FileTimestampFormat) {
    auto epoch = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123));
    EXPECT_EQ(ReportWriter::fileTimestamp(epoch), "2023-11-14T22-13-20-123Z");
    EXPECT_EQ(isoTimestamp(epoch), "2023-11-14T22:13:20.123Z");
}

TEST(ReportWriterTest, JsonCarriesSummaryAndClassification) {
    auto report = sampleReport();
    json out = ReportWriter::toJson(report);

    EXPECT_EQ(out["summary"]["total"], 3);
    EXPECT_EQ(out["summary"]["expectedTotal"], 5);
    EXPECT_EQ(out["summary"]["complete"], false);
    EXPECT_EQ(out["summary"]["success"], false);
    ASSERT_EQ(out["tests"].size(), 3u);
    EXPECT_EQ(out["tests"][0]["status"], "PASSED");
    EXPECT_FALSE(out["tests"][0].contains("source"));
    EXPECT_EQ(out["tests"][1]["source"], "SERVER");
    EXPECT_EQ(out["tests"][1]["fixLocation"], "BACKEND");
    EXPECT_EQ(out["tests"][1]["error"]["httpStatus"], 500);
    EXPECT_EQ(out["suiteFailures"][0]["group"], "cors");
    EXPECT_EQ(out["environment"]["backendUrl"], "http://127.0.0.1:3470");
    EXPECT_FALSE(out.contains("crash"));
}

TEST(ReportWriterTest, ErrorsFileGroupsBySource) {
    auto text = ReportWriter::renderErrors(sampleReport());

    auto sdk = text.find("=== SDK");
    auto server = text.find("=== SERVER errors (1)");
    auto network = text.find("=== NETWORK errors (1)");
    EXPECT_EQ(sdk, std::string::npos);
    ASSERT_NE(server, std::string::npos);
    ASSERT_NE(network, std::string::npos);
    EXPECT_LT(server, network);
    EXPECT_THAT(text, HasSubstr("=== Suite failures (1)"));
    EXPECT_THAT(text, HasSubstr("INCOMPLETE: 3 of 5"));
    EXPECT_THAT(text, Not(HasSubstr("No failures.")));
}

TEST(ReportWriterTest, CleanRunSaysNoFailures) {
    RunReport report;
    report.outcomes = {passedOutcome("health", "ping")};
    report.passed = report.total = 1;
    EXPECT_THAT(ReportWriter::renderErrors(report), HasSubstr("No failures."));
    EXPECT_THAT(ReportWriter::renderNarrative(report), HasSubstr("Result: SUCCESS"));
}

TEST(ReportWriterTest, WritesFileSetWithoutOverwriting) {
    Utils::TempDirectory dir;
    ReportWriter writer(dir.path() / "reports");
    auto report = sampleReport();

    auto first = writer.write(report, {"[ts] [backend:stdout] listening"});
    ASSERT_EQ(first.size(), 4u);
    for (const auto &path : first) {
        EXPECT_TRUE(std::filesystem::exists(path)) << path;
        EXPECT_FALSE(std::filesystem::exists(path + ".tmp")) << path;
    }
    EXPECT_THAT(first[0], HasSubstr("test-results-"));
    EXPECT_THAT(first[2], HasSubstr("test-errors-"));
    EXPECT_THAT(first[3], HasSubstr("test-full-output-"));
    EXPECT_THAT(readFile(first[3]), HasSubstr("listening"));

    auto parsed = JsonUtils::parseFile(first[0]);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ((*parsed)["reportFiles"].size(), 4u);

    // No transcript: three files, never clobbering the first set
    auto second = writer.write(report, {});
    ASSERT_EQ(second.size(), 3u);
    for (const auto &path : second) {
        EXPECT_TRUE(std::find(first.begin(), first.end(), path) == first.end()) << path;
    }
}

TEST(ReportWriterTest, UnusableDirectoryIsReportedNotThrown) {
    Utils::TempDirectory dir;
    auto blocker = dir.write("not-a-dir", "file");
    ReportWriter writer(blocker / "reports");
    EXPECT_TRUE(writer.write(sampleReport(), {}).empty());
}

TEST(ReportWriterTest, BuildErrorArtifactCarriesCommandAndOutput) {
    Utils::TempDirectory dir;
    ReportWriter writer(dir.path() / "reports");
    BuildFailure failure{"backend", "npm run build:backend", 2, "src/app.ts(3,1): error TS1005"};

    auto first = writer.writeBuildError(failure);
    auto second = writer.writeBuildError(failure);
    ASSERT_FALSE(first.empty());
    ASSERT_FALSE(second.empty());
    EXPECT_NE(first, second);
    EXPECT_THAT(first, HasSubstr("build-error-"));

    const std::string content = readFile(first);
    EXPECT_THAT(content, HasSubstr("Build Step: backend"));
    EXPECT_THAT(content, HasSubstr("Build Command: npm run build:backend"));
    EXPECT_THAT(content, HasSubstr("Exit Code: 2"));
    EXPECT_THAT(content, HasSubstr("error TS1005"));
}

TEST(ReportWriterTest, FatalErrorArtifact) {
    const std::string text =
        ReportWriter::renderFatalError("socket closed", std::chrono::milliseconds(1234), "2025-01-01T00:00:00.000Z");
    EXPECT_THAT(text, HasSubstr("FATAL ERROR"));
    EXPECT_THAT(text, HasSubstr("Duration: 1234ms"));
    EXPECT_THAT(text, HasSubstr("socket closed"));

    Utils::TempDirectory dir;
    auto blocker = dir.write("not-a-dir", "file");
    EXPECT_TRUE(ReportWriter(blocker / "reports").writeFatalError("boom", std::chrono::milliseconds(1)).empty());
}

}  // namespace Test
}  // namespace TOE

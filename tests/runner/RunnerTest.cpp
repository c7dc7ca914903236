#include "runner/Runner.h"
#include "common/HarnessErrors.h"
#include "common/TestUtils.h"
#include "mocks/MockCommandRunner.h"
#include "mocks/MockHttpClient.h"
#include "reporting/FailureHistory.h"
#include "scheduling/TestSuiteContext.h"
#include "common/JsonUtils.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <csignal>
#include <fstream>
#include <sstream>

namespace TOE {
namespace Test {

using ::testing::_;
using ::testing::AllOf;
using ::testing::Field;
using ::testing::AnyNumber;
using ::testing::HasSubstr;
using ::testing::InSequence;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class RunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        http_ = std::make_shared<NiceMock<MockHttpClient>>();
        commands_ = std::make_shared<NiceMock<MockCommandRunner>>();
        ON_CALL(*http_, sendRequest(_)).WillByDefault(Respond(MockHttpClient::status(200, "{}")));
        ON_CALL(*commands_, run(_)).WillByDefault(Return(MockCommandRunner::notFound()));

        config_.reportsDir = dir_.path() / "reports";
        config_.projectRoot = dir_.path();
        config_.dataDir = dir_.path() / "data";
        config_.manageServices = false;
        config_.buildSteps.clear();
    }

    void useLocalServices(const std::string &backendCommand, const std::string &frontendCommand) {
        config_.manageServices = true;
        config_.backendCommand = backendCommand;
        config_.frontendCommand = frontendCommand;
        config_.backendHealthUrl = "http://127.0.0.1:38470/health";
        config_.frontendHealthUrl = "http://127.0.0.1:38498/api/health";
    }

    std::vector<std::filesystem::path> artifacts(const std::string &prefix) const {
        std::vector<std::filesystem::path> found;
        std::error_code ec;
        for (std::filesystem::directory_iterator it(config_.reportsDir, ec), end; !ec && it != end; it.increment(ec)) {
            if (it->path().filename().string().rfind(prefix, 0) == 0) {
                found.push_back(it->path());
            }
        }
        return found;
    }

    static std::string readFile(const std::filesystem::path &path) {
        std::ifstream in(path);
        std::ostringstream content;
        content << in.rdbuf();
        return content.str();
    }

    std::unique_ptr<Runner> makeRunner() {
        auto runner = std::make_unique<Runner>(config_, http_, commands_);
        runner->setSleeper(Utils::CountingSleeper{});
        return runner;
    }

    static TestGroup group(const std::string &name, std::vector<std::string> dependencies, TestGroup::Body body,
                           int declaredTests) {
        TestGroup result;
        result.name = name;
        result.dependencies = std::move(dependencies);
        result.declaredTests = declaredTests;
        result.body = std::move(body);
        return result;
    }

    Utils::TempDirectory dir_;
    HarnessConfig config_;
    std::shared_ptr<NiceMock<MockHttpClient>> http_;
    std::shared_ptr<NiceMock<MockCommandRunner>> commands_;
};

TEST_F(RunnerTest, RequiresCollaborators) {
    EXPECT_THROW(Runner(config_, nullptr, commands_), std::invalid_argument);
    EXPECT_THROW(Runner(config_, http_, nullptr), std::invalid_argument);
}

TEST_F(RunnerTest, PassingRunExitsZeroAndWritesReport) {
    auto runner = makeRunner();
    runner->registry().add(group("health", {}, [](TestSuiteContext &suite) {
        suite.test("ping", [] {});
        suite.test("version", [] {});
    }, 2));

    EXPECT_EQ(runner->run(), 0);

    ASSERT_TRUE(runner->lastReport().has_value());
    const auto &report = *runner->lastReport();
    EXPECT_EQ(report.total, 2);
    EXPECT_EQ(report.expectedTotal, 2);
    EXPECT_TRUE(report.complete());
    EXPECT_EQ(report.environment.at("manageServices"), "false");
    EXPECT_FALSE(report.reportFiles.empty());
    EXPECT_TRUE(FailureHistory(config_.reportsDir).latestReport().has_value());
}

TEST_F(RunnerTest, FailingTestExitsOneAndIsRememberedForOnlyFailing) {
    auto runner = makeRunner();
    runner->registry().add(group("health", {}, [](TestSuiteContext &suite) { suite.test("ping", [] {}); }, 1));
    runner->registry().add(group("projects", {}, [](TestSuiteContext &suite) {
        suite.test("create", [&suite] { suite.check(false, "no id returned"); });
    }, 1));

    EXPECT_EQ(runner->run(), 1);
    EXPECT_THAT(FailureHistory(config_.reportsDir).failedGroups(), ::testing::ElementsAre("projects"));
}

TEST_F(RunnerTest, UnreachableTargetIsSetupFailure) {
    ON_CALL(*http_, sendRequest(_)).WillByDefault(Respond(MockHttpClient::refused()));

    bool ran = false;
    auto runner = makeRunner();
    runner->registry().add(group("health", {}, [&ran](TestSuiteContext &suite) {
        ran = true;
        suite.test("ping", [] {});
    }, 1));

    EXPECT_EQ(runner->run(), 1);
    EXPECT_FALSE(ran);
    ASSERT_TRUE(runner->lastReport()->setupError.has_value());
    EXPECT_THAT(runner->lastReport()->setupError->message, HasSubstr("Connect failed"));
    EXPECT_FALSE(runner->lastReport()->complete());
}

TEST_F(RunnerTest, CreatedProjectIsDeletedAfterRun) {
    EXPECT_CALL(*http_, sendRequest(_)).Times(::testing::AnyNumber());
    ON_CALL(*http_, sendRequest(AllOf(Field(&HttpClient::Request::method, "POST"),
                                      Field(&HttpClient::Request::url, HasSubstr("/auth/login")))))
        .WillByDefault(Respond(MockHttpClient::status(200, R"({"session_token":"tok"})")));
    ON_CALL(*http_, sendRequest(AllOf(Field(&HttpClient::Request::method, "POST"),
                                      Field(&HttpClient::Request::url, HasSubstr("/api/krapi/k1/projects")))))
        .WillByDefault(Respond(MockHttpClient::status(201, R"({"id":"proj-7"})")));
    EXPECT_CALL(*http_, sendRequest(AllOf(Field(&HttpClient::Request::method, "DELETE"),
                                          Field(&HttpClient::Request::url, HasSubstr("/projects/proj-7")))))
        .Times(1);

    auto runner = makeRunner();
    TestGroup projects = group("projects", {}, [](TestSuiteContext &suite) {
        suite.test("has project", [&suite] { suite.check(suite.session().hasProject(), "no project"); });
    }, 1);
    projects.requirements.needsProject = true;
    runner->registry().add(projects);

    EXPECT_EQ(runner->run(), 0);
    EXPECT_EQ(runner->lastReport()->testProjectId, "proj-7");
}

TEST_F(RunnerTest, InvalidSelectionFailsBeforeAnything) {
    config_.selection.only = {"ghost"};
    EXPECT_CALL(*http_, sendRequest(_)).Times(0);

    auto runner = makeRunner();
    runner->registry().add(group("health", {}, [](TestSuiteContext &) {}, 0));

    EXPECT_THROW(runner->run(), ConfigurationException);
    EXPECT_FALSE(std::filesystem::exists(config_.reportsDir));
}

TEST_F(RunnerTest, ManagedRunReconcilesAndSupervisesServices) {
    useLocalServices("while true; do sleep 0.1; done", "while true; do sleep 0.1; done");
    dir_.write("data/krapi_main.db");
    dir_.write("data/projects/old.db");

    auto runner = makeRunner();
    ReadinessPolicy policy;
    policy.maxAttempts = 3;
    policy.interval = std::chrono::milliseconds(10);
    runner->setReadinessPolicy(policy);
    runner->registry().add(group("health", {}, [](TestSuiteContext &suite) { suite.test("ping", [] {}); }, 1));

    EXPECT_EQ(runner->run(), 0);
    EXPECT_FALSE(std::filesystem::exists(dir_.path() / "data" / "krapi_main.db"));
    EXPECT_FALSE(std::filesystem::exists(dir_.path() / "data" / "projects" / "old.db"));
    EXPECT_TRUE(std::filesystem::exists(config_.reportsDir / ".cleanup-warnings"));
}

TEST_F(RunnerTest, CrashingServiceFailsRunAndTakesDownItsPeer) {
    const auto pidFile = dir_.path() / "frontend.pid";
    useLocalServices("sleep 0.3; echo 'Error: Cannot find module ./server'; sleep 5",
                     "echo $$ > '" + pidFile.string() + "'; trap '' TERM; while true; do sleep 0.1; done");
    ON_CALL(*http_, sendRequest(_)).WillByDefault(Respond(MockHttpClient::status(503)));

    auto runner = makeRunner();
    ReadinessPolicy policy;
    policy.maxAttempts = 200;
    policy.interval = std::chrono::milliseconds(20);
    runner->setReadinessPolicy(policy);
    runner->registry().add(group("health", {}, [](TestSuiteContext &suite) { suite.test("ping", [] {}); }, 1));

    EXPECT_EQ(runner->run(), 1);
    ASSERT_TRUE(runner->lastReport()->crash.has_value());
    EXPECT_EQ(runner->lastReport()->crash->service, "backend");
    EXPECT_FALSE(runner->lastReport()->reportFiles.empty());
    EXPECT_FALSE(runner->running());

    // The healthy frontend ignored SIGTERM and was still killed and reaped
    ASSERT_TRUE(std::filesystem::exists(pidFile));
    const pid_t frontendPid = std::stoi(readFile(pidFile));
    EXPECT_NE(::kill(frontendPid, 0), 0);
}

TEST_F(RunnerTest, PreparationBuildsInOrderAndConfiguresApp) {
    useLocalServices("while true; do sleep 0.1; done", "while true; do sleep 0.1; done");
    config_.buildSteps = {{"packages", "make packages", true}, {"backend", "make backend", true}};
    dir_.write("backend-server/.env", "PORT=3470\nDISABLE_RATE_LIMIT=false\n");

    EXPECT_CALL(*commands_, run(_)).Times(AnyNumber());
    {
        InSequence sequence;
        EXPECT_CALL(*commands_, run(HasSubstr("make packages"))).WillOnce(Return(MockCommandRunner::ok()));
        EXPECT_CALL(*commands_, run(HasSubstr("make backend"))).WillOnce(Return(MockCommandRunner::ok()));
    }

    auto runner = makeRunner();
    ReadinessPolicy policy;
    policy.maxAttempts = 3;
    policy.interval = std::chrono::milliseconds(10);
    runner->setReadinessPolicy(policy);
    runner->registry().add(group("health", {}, [](TestSuiteContext &suite) { suite.test("ping", [] {}); }, 1));

    EXPECT_EQ(runner->run(), 0);

    const std::string backendEnv = readFile(dir_.path() / "backend-server" / ".env");
    EXPECT_THAT(backendEnv, HasSubstr("PORT=3470\n"));
    EXPECT_THAT(backendEnv, HasSubstr("DISABLE_RATE_LIMIT=true\n"));
    EXPECT_THAT(backendEnv, HasSubstr("https://app1.example.com"));

    auto appConfig = JsonUtils::parseFile((dir_.path() / "config" / "krapi-config.json").string());
    ASSERT_TRUE(appConfig.has_value());
    EXPECT_FALSE((*appConfig)["security"]["rateLimit"]["enabled"].get<bool>());
    EXPECT_EQ((*appConfig)["frontend"]["url"], "http://127.0.0.1:3498");
}

TEST_F(RunnerTest, BuildFailureStopsBeforeServicesStart) {
    const auto marker = dir_.path() / "started";
    useLocalServices("touch '" + marker.string() + "'; while true; do sleep 0.1; done",
                     "touch '" + marker.string() + "'; while true; do sleep 0.1; done");
    config_.buildSteps = {{"frontend", "make frontend", true}};
    ON_CALL(*commands_, run(HasSubstr("make frontend")))
        .WillByDefault(Return(MockCommandRunner::exited(2, "error TS2304: Cannot find name 'foo'\n")));

    auto runner = makeRunner();
    runner->registry().add(group("health", {}, [](TestSuiteContext &suite) { suite.test("ping", [] {}); }, 1));

    EXPECT_EQ(runner->run(), 1);
    ASSERT_TRUE(runner->lastReport()->setupError.has_value());
    EXPECT_THAT(runner->lastReport()->setupError->message, HasSubstr("Build step 'frontend' failed (exit 2)"));
    EXPECT_FALSE(std::filesystem::exists(marker));

    auto buildErrors = artifacts("build-error-");
    ASSERT_EQ(buildErrors.size(), 1u);
    EXPECT_THAT(readFile(buildErrors.front()), HasSubstr("TS2304"));
}

TEST_F(RunnerTest, DataDirectoryBlockedByFileIsSetupFailure) {
    const auto marker = dir_.path() / "started";
    useLocalServices("touch '" + marker.string() + "'; while true; do sleep 0.1; done",
                     "touch '" + marker.string() + "'; while true; do sleep 0.1; done");
    dir_.write("data", "not a directory");

    auto runner = makeRunner();
    runner->registry().add(group("health", {}, [](TestSuiteContext &suite) { suite.test("ping", [] {}); }, 1));

    EXPECT_EQ(runner->run(), 1);
    ASSERT_TRUE(runner->lastReport()->setupError.has_value());
    EXPECT_THAT(runner->lastReport()->setupError->message, HasSubstr("Cannot create directory"));
    EXPECT_FALSE(std::filesystem::exists(marker));
}

TEST_F(RunnerTest, ErrorEscapingTeardownLeavesFatalLog) {
    EXPECT_CALL(*http_, sendRequest(_)).Times(AnyNumber());
    ON_CALL(*http_, sendRequest(AllOf(Field(&HttpClient::Request::method, "POST"),
                                      Field(&HttpClient::Request::url, HasSubstr("/auth/login")))))
        .WillByDefault(Respond(MockHttpClient::status(200, R"({"session_token":"tok"})")));
    ON_CALL(*http_, sendRequest(AllOf(Field(&HttpClient::Request::method, "POST"),
                                      Field(&HttpClient::Request::url, HasSubstr("/api/krapi/k1/projects")))))
        .WillByDefault(Respond(MockHttpClient::status(201, R"({"id":"proj-9"})")));
    EXPECT_CALL(*http_, sendRequest(Field(&HttpClient::Request::method, "DELETE")))
        .WillOnce(Throw(std::runtime_error("socket closed")));

    auto runner = makeRunner();
    TestGroup projects = group("projects", {}, [](TestSuiteContext &suite) { suite.test("noop", [] {}); }, 1);
    projects.requirements.needsProject = true;
    runner->registry().add(projects);

    EXPECT_THROW(runner->run(), std::runtime_error);
    EXPECT_FALSE(runner->running());
    runner->requestStop();

    auto fatalLogs = artifacts("fatal-error-");
    ASSERT_EQ(fatalLogs.size(), 1u);
    EXPECT_THAT(readFile(fatalLogs.front()), HasSubstr("socket closed"));
}

}  // namespace Test
}  // namespace TOE

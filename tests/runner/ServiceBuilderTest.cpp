#include "runner/ServiceBuilder.h"
#include "mocks/MockCommandRunner.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace TOE {
namespace Test {

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::InSequence;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::StrictMock;

TEST(ServiceBuilderTest, RequiresCommandRunner) {
    EXPECT_THROW(ServiceBuilder(nullptr, "/srv/app"), std::invalid_argument);
}

TEST(ServiceBuilderTest, RunsStepsInOrderFromProjectRoot) {
    auto commands = std::make_shared<StrictMock<MockCommandRunner>>();
    {
        InSequence sequence;
        EXPECT_CALL(*commands, run(HasSubstr("cd '/srv/app' && ( npm run build:packages ) 2>&1")))
            .WillOnce(Return(MockCommandRunner::ok("built")));
        EXPECT_CALL(*commands, run(HasSubstr("npm run build:backend"))).WillOnce(Return(MockCommandRunner::ok()));
    }

    ServiceBuilder builder(commands, "/srv/app");
    EXPECT_NO_THROW(builder.build({{"packages", "npm run build:packages", true},
                                   {"backend", "npm run build:backend", true}}));
}

TEST(ServiceBuilderTest, FirstRequiredFailureStopsTheSequence) {
    auto commands = std::make_shared<StrictMock<MockCommandRunner>>();
    EXPECT_CALL(*commands, run(HasSubstr("build:packages")))
        .WillOnce(Return(MockCommandRunner::exited(1, "npm ERR! missing script: build:packages\n")));

    ServiceBuilder builder(commands, "/srv/app");
    try {
        builder.build({{"packages", "npm run build:packages", true}, {"backend", "npm run build:backend", true}});
        FAIL() << "Expected BuildException";
    } catch (const BuildException &e) {
        EXPECT_EQ(e.failure().step, "packages");
        EXPECT_EQ(e.failure().exitCode, 1);
        EXPECT_THAT(e.failure().output, HasSubstr("missing script"));
        EXPECT_THAT(e.error().message, HasSubstr("Build step 'packages' failed (exit 1)"));
    }
}

TEST(ServiceBuilderTest, OptionalFailureContinues) {
    auto commands = std::make_shared<NiceMock<MockCommandRunner>>();
    ON_CALL(*commands, run(_)).WillByDefault(Return(MockCommandRunner::ok()));
    ON_CALL(*commands, run(HasSubstr("rebuild"))).WillByDefault(Return(MockCommandRunner::exited(1)));
    EXPECT_CALL(*commands, run(_)).Times(2);

    ServiceBuilder builder(commands, "/srv/app");
    EXPECT_NO_THROW(builder.build({{"sqlite", "npm rebuild better-sqlite3", false}, {"backend", "make", true}}));
}

TEST(ServiceBuilderTest, ShellThatCannotStartIsFailure) {
    auto commands = std::make_shared<NiceMock<MockCommandRunner>>();
    ON_CALL(*commands, run(_)).WillByDefault(Return(CommandResult{}));

    ServiceBuilder builder(commands, "");
    try {
        builder.build({{"install", "npm run install:all", true}});
        FAIL() << "Expected BuildException";
    } catch (const BuildException &e) {
        EXPECT_EQ(e.failure().exitCode, -1);
    }
}

TEST(ServiceBuilderTest, CommandLineQuotesDirectoryAndMergesStderr) {
    EXPECT_EQ(ServiceBuilder::commandLine("/srv/it's", "make"), "( cd '/srv/it'\\''s' && ( make ) 2>&1 )");
    EXPECT_EQ(ServiceBuilder::commandLine("", "make"), "( ( make ) 2>&1 )");
}

TEST(ServiceBuilderTest, DefaultStepsBuildEveryService) {
    auto steps = ServiceBuilder::defaultSteps();
    std::vector<std::string> names;
    for (const auto &step : steps) {
        names.push_back(step.name);
    }
    EXPECT_THAT(names, ::testing::ElementsAre("install", "sqlite", "packages", "backend", "frontend"));
    EXPECT_FALSE(steps[1].required);
}

}  // namespace Test
}  // namespace TOE

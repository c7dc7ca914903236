#include "runner/AppConfigurator.h"
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

std::string readFile(const std::filesystem::path &path) {
    std::ifstream in(path);
    std::ostringstream content;
    content << in.rdbuf();
    return content.str();
}

}  // namespace

TEST(AppConfiguratorTest, OriginOfDropsPathAndDefaultPort) {
    EXPECT_EQ(AppConfigurator::originOf("http://127.0.0.1:3470/health"), "http://127.0.0.1:3470");
    EXPECT_EQ(AppConfigurator::originOf("https://example.com/x"), "https://example.com");
    EXPECT_EQ(AppConfigurator::originOf("not a url"), "");
}

TEST(AppConfiguratorTest, EnvUpdateRewritesInPlaceAndAppends) {
    const std::string before = "# comment\nPORT=3470\nALLOWED_ORIGINS=http://old\n\nOTHER=1";
    const std::string after =
        AppConfigurator::updateEnvContent(before, {{"ALLOWED_ORIGINS", "http://a,http://b"}, {"ENABLE_CORS", "true"}});
    EXPECT_EQ(after, "# comment\nPORT=3470\nALLOWED_ORIGINS=http://a,http://b\n\nOTHER=1\nENABLE_CORS=true\n");
}

TEST(AppConfiguratorTest, SettingsPreserveUnrelatedConfig) {
    json config = {{"database", {{"path", "data/krapi.db"}}}, {"security", {{"jwtSecret", "x"}}}};
    auto settings = AppConfigurator::defaultSettings("http://127.0.0.1:3498", "http://127.0.0.1:3470/health");

    json updated = AppConfigurator::applySettings(config, settings);
    EXPECT_EQ(updated["database"]["path"], "data/krapi.db");
    EXPECT_EQ(updated["security"]["jwtSecret"], "x");
    EXPECT_TRUE(updated["security"]["enableCors"].get<bool>());
    EXPECT_FALSE(updated["security"]["rateLimit"]["enabled"].get<bool>());
    EXPECT_EQ(updated["security"]["allowedOrigins"].size(), 4u);
    EXPECT_EQ(updated["backend"]["url"], "http://127.0.0.1:3470");
}

TEST(AppConfiguratorTest, LocalOriginsComeFirstWithoutDuplicates) {
    AppTestSettings settings;
    settings.frontendUrl = "http://127.0.0.1:3498";
    settings.backendUrl = "http://127.0.0.1:3470";
    settings.allowedOrigins = {"https://app1.example.com", "http://127.0.0.1:3498"};

    auto origins = AppConfigurator::originsWithLocalhost(settings);
    EXPECT_EQ(origins.front(), "http://localhost");
    EXPECT_EQ(std::count(origins.begin(), origins.end(), "http://127.0.0.1:3498"), 1);
    EXPECT_EQ(origins.back(), "https://app1.example.com");
}

TEST(AppConfiguratorTest, ConfigureWritesConfigAndExistingEnvDirectories) {
    Utils::TempDirectory dir;
    dir.write("config/krapi-config.json", R"({"server": {"port": 3470}})");
    dir.write("backend-server/.env", "PORT=3470\n");

    AppConfigurator configurator(dir.path());
    EXPECT_TRUE(configurator.configure(
        AppConfigurator::defaultSettings("http://127.0.0.1:3498", "http://127.0.0.1:3470/health")));

    auto config = JsonUtils::parseFile(configurator.configPath().string());
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ((*config)["server"]["port"], 3470);
    EXPECT_EQ((*config)["frontend"]["url"], "http://127.0.0.1:3498");

    const std::string backendEnv = readFile(dir.path() / "backend-server" / ".env");
    EXPECT_THAT(backendEnv, HasSubstr("PORT=3470\n"));
    EXPECT_THAT(backendEnv, HasSubstr("RATE_LIMIT_MAX_REQUESTS=999999\n"));
    EXPECT_THAT(backendEnv, HasSubstr("http://localhost:3470"));

    EXPECT_THAT(readFile(dir.path() / ".env"), HasSubstr("ENABLE_CORS=true\n"));
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "frontend-manager"));
}

TEST(AppConfiguratorTest, MalformedConfigIsReplaced) {
    Utils::TempDirectory dir;
    dir.write("config/krapi-config.json", "{ not json");

    AppConfigurator configurator(dir.path());
    EXPECT_TRUE(configurator.configure(AppConfigurator::defaultSettings("http://127.0.0.1:3498", "")));
    EXPECT_THAT(readFile(configurator.configPath()), Not(HasSubstr("not json")));
}

TEST(AppConfiguratorTest, UnwritableConfigIsReportedNotThrown) {
    Utils::TempDirectory dir;
    // A file where the config directory should be
    dir.write("config", "blocked");

    AppConfigurator configurator(dir.path());
    EXPECT_FALSE(configurator.configure(AppConfigurator::defaultSettings("http://127.0.0.1:3498", "")));
}

}  // namespace Test
}  // namespace TOE

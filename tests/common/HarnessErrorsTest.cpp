#include "common/HarnessErrors.h"
#include "common/JsonUtils.h"
#include "common/StringUtils.h"
#include <gtest/gtest.h>

namespace TOE {
namespace Test {

TEST(HarnessErrorsTest, SetupErrorDescribesEveryService) {
    SetupError error;
    error.message = "Services not ready after 3 attempts";
    error.services.push_back({"backend", "http://127.0.0.1:3470/health", 503, "", true});
    error.services.push_back({"frontend", "http://127.0.0.1:3498/api/health", 0, "Connection refused", false});

    std::string text = describe(HarnessError{error});
    EXPECT_NE(text.find("backend: status=503 alive=true"), std::string::npos) << text;
    EXPECT_NE(text.find("frontend: status=0 alive=false error=Connection refused"), std::string::npos) << text;

    SetupException exception(error);
    EXPECT_EQ(exception.error().services.size(), 2u);
    EXPECT_EQ(std::string(exception.what()), text);
}

TEST(HarnessErrorsTest, CrashDescribesSignatureOrExitCode) {
    ProcessCrash bySignature{"backend", "UNIQUE constraint failed", "SqliteError: UNIQUE constraint failed: x", -1};
    EXPECT_NE(describe(HarnessError{bySignature}).find("emitted 'UNIQUE constraint failed'"), std::string::npos);

    ProcessCrash byExit{"frontend", "", "", 1};
    EXPECT_NE(describe(HarnessError{byExit}).find("exited with code 1"), std::string::npos);
}

TEST(HarnessErrorsTest, ApiExceptionKeepsRequestContext) {
    ApiException error("GET /x returned HTTP 500", 500, "", "GET", "http://h/x", "{\"error\":\"boom\"}");
    EXPECT_EQ(error.statusCode(), 500);
    EXPECT_EQ(error.method(), "GET");
    EXPECT_EQ(error.url(), "http://h/x");
    EXPECT_TRUE(error.requestSent());
}

TEST(JsonUtilsTest, FindIdAcceptsEnvelopeAndNumbers) {
    EXPECT_EQ(JsonUtils::findId(json{{"id", "p-1"}}), "p-1");
    EXPECT_EQ(JsonUtils::findId(json{{"data", {{"id", 42}}}}), "42");
    EXPECT_EQ(JsonUtils::findId(json{{"name", "x"}}), "");
    EXPECT_EQ(JsonUtils::findId(json::array()), "");
}

TEST(JsonUtilsTest, ParseReportsErrors) {
    std::string error;
    EXPECT_FALSE(JsonUtils::parseJson("{not json", &error).has_value());
    EXPECT_FALSE(error.empty());
    auto parsed = JsonUtils::parseJson("{\"a\": 1}");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(JsonUtils::getInt(*parsed, "a"), 1);
    EXPECT_EQ(JsonUtils::getString(*parsed, "a", "fallback"), "fallback");
}

TEST(StringUtilsTest, SplitListTrimsAndDropsEmpty) {
    auto parts = splitList(" auth, projects,,cors ");
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "auth");
    EXPECT_EQ(parts[2], "cors");
    EXPECT_EQ(joinList(parts), "auth, projects, cors");
}

TEST(StringUtilsTest, TruncateLinesKeepsPrefix) {
    EXPECT_EQ(truncateLines("a\nb\nc\nd", 2), "a\nb");
    EXPECT_EQ(truncateLines("a\nb", 5), "a\nb");
}

}  // namespace Test
}  // namespace TOE

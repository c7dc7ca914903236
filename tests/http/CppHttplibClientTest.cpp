#include "http/CppHttplibClient.h"
#include "common/TestUtils.h"
#include <gtest/gtest.h>

#include <httplib.h>
#include <thread>

namespace TOE {
namespace Test {

/**
 * @brief Local httplib server answering a handful of fixed routes
 */
class CppHttplibClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_.Get("/health", [](const httplib::Request &, httplib::Response &res) {
            res.set_content(R"({"status":"ok"})", "application/json");
        });
        server_.Post("/echo", [](const httplib::Request &req, httplib::Response &res) {
            res.status = 201;
            res.set_header("X-Auth-Seen", req.get_header_value("Authorization"));
            res.set_content(req.body, "application/json");
        });
        server_.Get("/broken", [](const httplib::Request &, httplib::Response &res) {
            res.status = 500;
            res.set_content(R"({"error":"boom"})", "application/json");
        });
        server_.Options("/cors", [](const httplib::Request &, httplib::Response &res) {
            res.status = 204;
            res.set_header("Access-Control-Allow-Origin", "*");
        });

        port_ = server_.bind_to_any_port("127.0.0.1");
        ASSERT_GT(port_, 0) << "Failed to bind local HTTP server";
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        ASSERT_TRUE(Utils::waitFor([this] { return server_.is_running(); }));

        client_.setTimeout(std::chrono::milliseconds(2000));
    }

    void TearDown() override {
        server_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    std::string url(const std::string &path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    HttpClient::Response send(const std::string &method, const std::string &path, const std::string &body = "",
                              std::map<std::string, std::string> headers = {}) {
        HttpClient::Request request;
        request.method = method;
        request.url = url(path);
        request.body = body;
        request.headers = std::move(headers);
        return client_.sendRequest(request).get();
    }

    httplib::Server server_;
    std::thread thread_;
    int port_ = 0;
    CppHttplibClient client_;
};

TEST_F(CppHttplibClientTest, SuccessfulGet) {
    auto response = send("GET", "/health");
    EXPECT_TRUE(response.success);
    EXPECT_EQ(response.statusCode, 200);
    EXPECT_EQ(response.body, R"({"status":"ok"})");
    EXPECT_TRUE(response.errorCode.empty());
}

TEST_F(CppHttplibClientTest, PostCarriesBodyAndHeaders) {
    auto response = send("POST", "/echo", R"({"name":"x"})", {{"Authorization", "Bearer abc"}});
    EXPECT_TRUE(response.success);
    EXPECT_EQ(response.statusCode, 201);
    EXPECT_EQ(response.body, R"({"name":"x"})");
    EXPECT_EQ(response.headers["X-Auth-Seen"], "Bearer abc");
}

TEST_F(CppHttplibClientTest, ServerErrorIsResponseNotTransportFailure) {
    auto response = send("GET", "/broken");
    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.statusCode, 500);
    EXPECT_TRUE(response.errorCode.empty());
}

TEST_F(CppHttplibClientTest, OptionsRequest) {
    auto response = send("OPTIONS", "/cors");
    EXPECT_EQ(response.statusCode, 204);
    EXPECT_EQ(response.headers["Access-Control-Allow-Origin"], "*");
}

TEST_F(CppHttplibClientTest, UnsupportedMethodAndSchemeAreRequestErrors) {
    EXPECT_EQ(send("TRACE", "/health").errorCode, "EREQUEST");

    HttpClient::Request request;
    request.method = "GET";
    request.url = "ftp://127.0.0.1/file";
    auto response = client_.sendRequest(request).get();
    EXPECT_EQ(response.statusCode, 0);
    EXPECT_EQ(response.errorCode, "EREQUEST");
}

TEST(CppHttplibClientStandaloneTest, ConnectionRefused) {
    // Bind then release a port so nothing is listening on it
    int freePort = 0;
    {
        httplib::Server probe;
        freePort = probe.bind_to_any_port("127.0.0.1");
    }
    ASSERT_GT(freePort, 0);

    CppHttplibClient client;
    client.setTimeout(std::chrono::milliseconds(2000));
    HttpClient::Request request;
    request.method = "GET";
    request.url = "http://127.0.0.1:" + std::to_string(freePort) + "/health";

    auto response = client.sendRequest(request).get();
    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.statusCode, 0);
    EXPECT_EQ(response.errorCode, "ECONNREFUSED");
}

TEST(CppHttplibClientStandaloneTest, ParseUrl) {
    auto [scheme, host, port, path] = CppHttplibClient::parseUrl("http://localhost:3498/api/health");
    EXPECT_EQ(scheme, "http");
    EXPECT_EQ(host, "localhost");
    EXPECT_EQ(port, 3498);
    EXPECT_EQ(path, "/api/health");

    auto defaults = CppHttplibClient::parseUrl("HTTPS://example.com");
    EXPECT_EQ(std::get<0>(defaults), "https");
    EXPECT_EQ(std::get<2>(defaults), 443);
    EXPECT_EQ(std::get<3>(defaults), "/");

    EXPECT_TRUE(std::get<0>(CppHttplibClient::parseUrl("not a url")).empty());
}

}  // namespace Test
}  // namespace TOE

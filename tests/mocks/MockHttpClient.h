#pragma once

#include "http/IHttpClient.h"
#include <gmock/gmock.h>

#include <future>

namespace TOE {
namespace Test {

/**
 * @brief gmock implementation of IHttpClient
 */
class MockHttpClient : public IHttpClient {
public:
    MOCK_METHOD(std::future<HttpClient::Response>, sendRequest, (const HttpClient::Request &request), (override));
    MOCK_METHOD(void, setTimeout, (std::chrono::milliseconds timeout), (override));

    static std::future<HttpClient::Response> ready(HttpClient::Response response) {
        std::promise<HttpClient::Response> promise;
        promise.set_value(std::move(response));
        return promise.get_future();
    }

    static HttpClient::Response status(int code, const std::string &body = "") {
        HttpClient::Response response;
        response.statusCode = code;
        response.success = code >= 200 && code < 300;
        response.body = body;
        return response;
    }

    static HttpClient::Response refused() {
        HttpClient::Response response;
        response.errorCode = "ECONNREFUSED";
        response.errorMessage = "Connection refused";
        return response;
    }
};

/**
 * @brief Action answering every request with the given response
 */
inline auto Respond(const HttpClient::Response &response) {
    return [response](const HttpClient::Request &) { return MockHttpClient::ready(response); };
}

}  // namespace Test
}  // namespace TOE

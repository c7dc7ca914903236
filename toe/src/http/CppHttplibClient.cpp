// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-TOE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of TOE (Test Orchestration Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)
//
// Commercial License:
//   Individual: $100 cumulative
//   Enterprise: $500 cumulative
//   Contact: https://github.com/newmassrael

#include "http/CppHttplibClient.h"
#include "common/Logger.h"
#include "common/StringUtils.h"

#include <httplib.h>
#include <netdb.h>
#include <regex>
#include <sys/socket.h>

namespace TOE {

namespace {

HttpClient::Response transportFailure(const std::string &code, const std::string &message) {
    HttpClient::Response response;
    response.success = false;
    response.statusCode = 0;
    response.errorCode = code;
    response.errorMessage = message;
    return response;
}

bool hostResolves(const std::string &host) {
    struct addrinfo hints {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo *info = nullptr;
    int rc = getaddrinfo(host.c_str(), nullptr, &hints, &info);
    if (info) {
        freeaddrinfo(info);
    }
    return rc == 0;
}

// httplib reports refused, unreachable and timed-out connects alike; elapsed time and name
// resolution separate them into the conventional errno-style codes
HttpClient::Response mapTransportError(httplib::Error error, const std::string &host,
                                       std::chrono::milliseconds elapsed, std::chrono::milliseconds timeout) {
    const bool timedOut = elapsed + std::chrono::milliseconds(50) >= timeout;
    switch (error) {
    case httplib::Error::Connection:
        if (!hostResolves(host)) {
            return transportFailure("ENOTFOUND", "getaddrinfo ENOTFOUND " + host);
        }
        if (timedOut) {
            return transportFailure("ETIMEDOUT", "connect ETIMEDOUT " + host);
        }
        return transportFailure("ECONNREFUSED", "connect ECONNREFUSED " + host);
    case httplib::Error::Read:
        if (timedOut) {
            return transportFailure("ETIMEDOUT", "read ETIMEDOUT " + host);
        }
        return transportFailure("ECONNRESET", "read ECONNRESET " + host);
    case httplib::Error::Write:
        return transportFailure("ECONNRESET", "write ECONNRESET " + host);
    case httplib::Error::Canceled:
        return transportFailure("EREQUEST", "request canceled");
    default:
        return transportFailure("EREQUEST", httplib::to_string(error));
    }
}

}  // namespace

CppHttplibClient::CppHttplibClient() {
    LOG_DEBUG("CppHttplibClient: Created (timeout={}ms)", timeout_.count());
}

std::tuple<std::string, std::string, int, std::string> CppHttplibClient::parseUrl(const std::string &url) {
    static const std::regex uriPattern(R"(^(https?)://([^:/\s]+)(?::(\d+))?(/.*)?$)", std::regex_constants::icase);
    std::smatch match;

    if (!std::regex_match(url, match, uriPattern)) {
        return {"", "", 0, ""};
    }

    std::string scheme = toLower(match[1].str());
    std::string host = match[2].str();

    int port;
    if (match[3].matched) {
        try {
            port = std::stoi(match[3].str());
        } catch (const std::exception &) {
            return {"", "", 0, ""};
        }
    } else {
        port = (scheme == "https") ? 443 : 80;
    }

    std::string path = match[4].matched ? match[4].str() : "/";

    return {scheme, host, port, path};
}

std::future<HttpClient::Response> CppHttplibClient::sendRequest(const HttpClient::Request &request) {
    auto timeout = timeout_;
    auto headers = customHeaders_;

    return std::async(std::launch::async, [request, timeout, headers]() -> HttpClient::Response {
        try {
            auto [scheme, host, port, path] = parseUrl(request.url);
            if (scheme.empty()) {
                LOG_ERROR("CppHttplibClient: Invalid URL: {}", request.url);
                return transportFailure("EREQUEST", "invalid URL: " + request.url);
            }
            if (scheme != "http") {
                LOG_ERROR("CppHttplibClient: Unsupported scheme: {}", request.url);
                return transportFailure("EREQUEST", "unsupported scheme: " + scheme);
            }

            LOG_TRACE("CppHttplibClient: {} {} (timeout={}ms)", request.method, request.url, timeout.count());

            httplib::Client client(host, port);

            client.set_connection_timeout(timeout);
            client.set_read_timeout(timeout);
            client.set_write_timeout(timeout);

            httplib::Headers httplibHeaders;
            for (const auto &[key, value] : headers) {
                httplibHeaders.emplace(key, value);
            }
            for (const auto &[key, value] : request.headers) {
                httplibHeaders.emplace(key, value);
            }

            const std::string contentType = request.contentType.empty() ? "application/json" : request.contentType;
            auto started = std::chrono::steady_clock::now();

            httplib::Result result;
            if (request.method == "GET") {
                result = client.Get(path, httplibHeaders);
            } else if (request.method == "POST") {
                result = client.Post(path, httplibHeaders, request.body, contentType);
            } else if (request.method == "PUT") {
                result = client.Put(path, httplibHeaders, request.body, contentType);
            } else if (request.method == "PATCH") {
                result = client.Patch(path, httplibHeaders, request.body, contentType);
            } else if (request.method == "DELETE") {
                result = client.Delete(path, httplibHeaders);
            } else if (request.method == "OPTIONS") {
                result = client.Options(path, httplibHeaders);
            } else {
                LOG_ERROR("CppHttplibClient: Unsupported HTTP method: {}", request.method);
                return transportFailure("EREQUEST", "unsupported method: " + request.method);
            }

            if (!result) {
                auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - started);
                auto response = mapTransportError(result.error(), host, elapsed, timeout);
                LOG_DEBUG("CppHttplibClient: {} {} failed: {}", request.method, request.url, response.errorCode);
                return response;
            }

            HttpClient::Response response;
            response.success = (result->status >= 200 && result->status < 300);
            response.statusCode = result->status;
            response.body = result->body;
            for (const auto &[key, value] : result->headers) {
                response.headers[key] = value;
            }

            LOG_TRACE("CppHttplibClient: Response {} (body {} bytes)", result->status, response.body.size());
            return response;

        } catch (const std::exception &e) {
            LOG_ERROR("CppHttplibClient: Exception: {}", e.what());
            return transportFailure("EREQUEST", e.what());
        }
    });
}

void CppHttplibClient::setTimeout(std::chrono::milliseconds timeout) {
    timeout_ = timeout;
    LOG_DEBUG("CppHttplibClient: Set timeout to {}ms", timeout.count());
}

void CppHttplibClient::setCustomHeaders(const std::map<std::string, std::string> &headers) {
    customHeaders_ = headers;
    LOG_DEBUG("CppHttplibClient: Set {} custom headers", headers.size());
}

std::unique_ptr<IHttpClient> createHttpClient() {
    return std::make_unique<CppHttplibClient>();
}

}  // namespace TOE

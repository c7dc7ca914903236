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

#pragma once

#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <string>

namespace TOE {

namespace HttpClient {

/**
 * @brief Outgoing HTTP request
 */
struct Request {
    std::string method;                          // "GET", "POST", "PUT", "PATCH", "DELETE", "OPTIONS"
    std::string url;                             // Full URL: "http://127.0.0.1:3498/api/health"
    std::string body;                            // Request payload
    std::string contentType;                     // "application/json", ...
    std::map<std::string, std::string> headers;  // Custom HTTP headers
};

/**
 * @brief Incoming HTTP response
 *
 * statusCode is 0 when no response arrived; errorCode then names the
 * transport failure (ECONNREFUSED, ETIMEDOUT, ECONNRESET, ENOTFOUND, EREQUEST).
 */
struct Response {
    bool success = false;                        // true if HTTP 200-299 and no network error
    int statusCode = 0;                          // HTTP status code (0 if network error)
    std::string body;                            // Response payload
    std::map<std::string, std::string> headers;  // Response headers
    std::string errorCode;                       // Transport error code, empty when a response arrived
    std::string errorMessage;                    // Transport error description
};

}  // namespace HttpClient

/**
 * @brief HTTP client interface
 *
 * Used for service health polling and for every call the test groups make
 * against the system under test. Tests substitute a gmock implementation.
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    /**
     * @brief Send HTTP request asynchronously
     *
     * @param request HTTP request data
     * @return Future with HTTP response; never throws through the future
     */
    virtual std::future<HttpClient::Response> sendRequest(const HttpClient::Request &request) = 0;

    /**
     * @brief Set request timeout
     */
    virtual void setTimeout(std::chrono::milliseconds timeout) = 0;
};

}  // namespace TOE

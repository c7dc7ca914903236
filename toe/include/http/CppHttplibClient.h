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

#include "http/IHttpClient.h"
#include <map>
#include <string>
#include <tuple>

namespace TOE {

/**
 * @brief Native HTTP client using cpp-httplib
 *
 * Each request runs on its own std::async worker with a fresh
 * httplib::Client, so one instance may be shared by the health poller and
 * the test bodies.
 */
class CppHttplibClient : public IHttpClient {
public:
    CppHttplibClient();
    ~CppHttplibClient() override = default;

    std::future<HttpClient::Response> sendRequest(const HttpClient::Request &request) override;
    void setTimeout(std::chrono::milliseconds timeout) override;

    void setCustomHeaders(const std::map<std::string, std::string> &headers);

    /**
     * @brief Split an http URL into scheme, host, port and path
     *
     * @return Empty scheme when the URL is not a valid http(s) URL
     */
    static std::tuple<std::string, std::string, int, std::string> parseUrl(const std::string &url);

private:
    std::chrono::milliseconds timeout_{5000};
    std::map<std::string, std::string> customHeaders_;
};

/**
 * @brief Create the default HTTP client
 */
std::unique_ptr<IHttpClient> createHttpClient();

}  // namespace TOE

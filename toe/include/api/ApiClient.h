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

#include "common/JsonUtils.h"
#include "common/RunContext.h"
#include "http/IHttpClient.h"

#include <map>
#include <memory>
#include <optional>
#include <string>

namespace TOE {

/**
 * @brief Thin client for the target system's HTTP API
 *
 * Paths are relative to the session's base URL. Authenticated calls carry
 * "Authorization: Bearer <session token>". Anything other than a 2xx
 * response throws ApiException with the request and response attached;
 * transport failures carry the transport code and status 0.
 */
class ApiClient {
public:
    ApiClient(std::shared_ptr<IHttpClient> http, SessionState &session);

    HttpClient::Response get(const std::string &path, bool authenticated = true);
    HttpClient::Response post(const std::string &path, const json &body, bool authenticated = true);
    HttpClient::Response put(const std::string &path, const json &body, bool authenticated = true);
    HttpClient::Response patch(const std::string &path, const json &body, bool authenticated = true);
    HttpClient::Response del(const std::string &path, bool authenticated = true);
    HttpClient::Response options(const std::string &path, const std::map<std::string, std::string> &headers);

    /**
     * @brief Issue a request
     * @param expectSuccess Throw ApiException on a non-2xx status
     * @throws ApiException on a transport failure, an unexpected status, or a
     *         missing session token (requestSent == false)
     */
    HttpClient::Response send(const std::string &method, const std::string &path, const std::optional<json> &body,
                              bool authenticated, const std::map<std::string, std::string> &headers = {},
                              bool expectSuccess = true);

    /**
     * @brief Parse a response body, unwrapping a {"data": ...} envelope
     * @throws ApiException when the body is not JSON
     */
    static json parseBody(const HttpClient::Response &response, const std::string &method = "",
                          const std::string &url = "");

    std::string urlFor(const std::string &path) const;

private:
    std::shared_ptr<IHttpClient> http_;
    SessionState &session_;
};

}  // namespace TOE

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

#include "api/ApiClient.h"
#include "common/HarnessErrors.h"
#include "common/Logger.h"

#include <stdexcept>

namespace TOE {

namespace {

// Server error text from {"error": "..."}, {"error": {"message": ...}} or {"message": "..."}
std::string serverMessage(const std::string &body) {
    auto parsed = JsonUtils::parseJson(body);
    if (!parsed || !parsed->is_object()) {
        return "";
    }
    if (parsed->contains("error")) {
        const auto &error = (*parsed)["error"];
        if (error.is_string()) {
            return error.get<std::string>();
        }
        if (error.is_object()) {
            return JsonUtils::getString(error, "message");
        }
    }
    return JsonUtils::getString(*parsed, "message");
}

}  // namespace

ApiClient::ApiClient(std::shared_ptr<IHttpClient> http, SessionState &session)
    : http_(std::move(http)), session_(session) {
    if (!http_) {
        throw std::invalid_argument("ApiClient requires an HTTP client");
    }
}

std::string ApiClient::urlFor(const std::string &path) const {
    if (path.rfind("http://", 0) == 0 || path.rfind("https://", 0) == 0) {
        return path;
    }
    std::string base = session_.baseUrl;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + (path.empty() || path.front() == '/' ? path : "/" + path);
}

HttpClient::Response ApiClient::get(const std::string &path, bool authenticated) {
    return send("GET", path, std::nullopt, authenticated);
}

HttpClient::Response ApiClient::post(const std::string &path, const json &body, bool authenticated) {
    return send("POST", path, body, authenticated);
}

HttpClient::Response ApiClient::put(const std::string &path, const json &body, bool authenticated) {
    return send("PUT", path, body, authenticated);
}

HttpClient::Response ApiClient::patch(const std::string &path, const json &body, bool authenticated) {
    return send("PATCH", path, body, authenticated);
}

HttpClient::Response ApiClient::del(const std::string &path, bool authenticated) {
    return send("DELETE", path, std::nullopt, authenticated);
}

HttpClient::Response ApiClient::options(const std::string &path, const std::map<std::string, std::string> &headers) {
    return send("OPTIONS", path, std::nullopt, false, headers);
}

HttpClient::Response ApiClient::send(const std::string &method, const std::string &path,
                                     const std::optional<json> &body, bool authenticated,
                                     const std::map<std::string, std::string> &headers, bool expectSuccess) {
    const std::string url = urlFor(path);

    HttpClient::Request request;
    request.method = method;
    request.url = url;
    request.headers = headers;
    if (body) {
        request.body = JsonUtils::toCompactString(*body);
        request.contentType = "application/json";
    }
    if (authenticated) {
        if (!session_.hasToken()) {
            throw ApiException("No session token: login required before " + method + " " + path, 0,
                               "SDK_NO_SESSION", method, url, "", false);
        }
        request.headers["Authorization"] = "Bearer " + session_.sessionToken;
    }

    LOG_DEBUG("ApiClient: {} {}", method, url);
    auto response = http_->sendRequest(request).get();

    if (response.statusCode == 0) {
        std::string code = response.errorCode.empty() ? "EREQUEST" : response.errorCode;
        throw ApiException(method + " " + path + " failed: " + response.errorMessage + " (" + code + ")", 0, code,
                           method, url);
    }
    if (expectSuccess && (response.statusCode < 200 || response.statusCode >= 300)) {
        std::string detail = serverMessage(response.body);
        std::string message = method + " " + path + " returned HTTP " + std::to_string(response.statusCode);
        if (!detail.empty()) {
            message += ": " + detail;
        }
        throw ApiException(message, response.statusCode, "", method, url, response.body);
    }
    return response;
}

json ApiClient::parseBody(const HttpClient::Response &response, const std::string &method, const std::string &url) {
    std::string error;
    auto parsed = JsonUtils::parseJson(response.body, &error);
    if (!parsed) {
        throw ApiException("Invalid response format: " + error, response.statusCode, "INVALID_RESPONSE", method, url,
                           response.body);
    }
    if (parsed->is_object() && parsed->contains("data") && !(*parsed)["data"].is_null()) {
        return (*parsed)["data"];
    }
    return *parsed;
}

}  // namespace TOE

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

#include "reporting/ErrorClassifier.h"
#include "common/HarnessErrors.h"
#include "common/JsonUtils.h"
#include "common/StringUtils.h"

#include <cxxabi.h>
#include <cstdlib>
#include <map>
#include <memory>
#include <regex>
#include <typeinfo>
#include <utility>
#include <vector>

namespace TOE {

const char *toString(ErrorSource source) {
    switch (source) {
    case ErrorSource::SDK:
        return "SDK";
    case ErrorSource::SERVER:
        return "SERVER";
    case ErrorSource::NETWORK:
        return "NETWORK";
    case ErrorSource::UNKNOWN:
        return "UNKNOWN";
    }
    return "UNKNOWN";
}

const char *toString(ErrorCategory category) {
    switch (category) {
    case ErrorCategory::MISSING_ENDPOINT:
        return "MISSING_ENDPOINT";
    case ErrorCategory::MISSING_METHOD:
        return "MISSING_METHOD";
    case ErrorCategory::INVALID_RESPONSE:
        return "INVALID_RESPONSE";
    case ErrorCategory::EMPTY_RESPONSE:
        return "EMPTY_RESPONSE";
    case ErrorCategory::TIMEOUT:
        return "TIMEOUT";
    case ErrorCategory::SERVER_ERROR:
        return "SERVER_ERROR";
    case ErrorCategory::VALIDATION_ERROR:
        return "VALIDATION_ERROR";
    case ErrorCategory::AUTH_ERROR:
        return "AUTH_ERROR";
    case ErrorCategory::UNKNOWN:
        return "UNKNOWN";
    }
    return "UNKNOWN";
}

const char *toString(FixLocation location) {
    switch (location) {
    case FixLocation::SDK:
        return "SDK";
    case FixLocation::BACKEND:
        return "BACKEND";
    case FixLocation::FRONTEND:
        return "FRONTEND";
    case FixLocation::TEST:
        return "TEST";
    case FixLocation::UNKNOWN:
        return "UNKNOWN";
    }
    return "UNKNOWN";
}

namespace {

bool matches(const std::string &text, const std::regex &expression) {
    return std::regex_search(text, expression);
}

std::regex icase(const char *expression) {
    return std::regex(expression, std::regex::ECMAScript | std::regex::icase);
}

const std::regex kNetworkMessage =
    icase("econnrefused|econnreset|enotfound|etimedout|timed out|timeout|connection refused|connection reset|"
          "getaddrinfo|network");
const std::regex kServerMessage =
    icase("missing.*field|empty.*response|invalid.*response.*format|wrong.*response|backend.*error|server.*error|"
          "failed to.*(fetch|get|create|update|delete)");
const std::regex kSdkMessage = icase("is not a function|method not available|cannot read property.*of undefined");

const std::regex kMissingEndpoint = icase("endpoint.*not.*found|route.*not.*found|cannot (post|get|put|patch|delete) ");
const std::regex kMissingMethod = icase("method not available|is not a function");
const std::regex kInvalidResponse = icase("invalid.*response|wrong.*response|missing.*field|unexpected.*response");
const std::regex kEmptyResponse = icase("empty|no data");
const std::regex kTimeout = icase("timeout|timed out|etimedout");
const std::regex kValidation = icase("validation|invalid|required|missing");
const std::regex kAuth = icase("unauthorized|forbidden|unauthenticated|not authenticated");

const char *const kFrontendPrefix = "/api/krapi/k1";

bool isTransportCode(const std::string &code) {
    return code == "ECONNREFUSED" || code == "ETIMEDOUT" || code == "ECONNRESET" || code == "ENOTFOUND";
}

bool isServerCode(const std::string &code) {
    return code == "INTERNAL_ERROR" || code == "SERVER_ERROR" || code == "SERVICE_UNAVAILABLE" ||
           code == "DATABASE_ERROR" || startsWith(code, "SQLITE");
}

std::string demangle(const char *name) {
    int status = 0;
    std::unique_ptr<char, void (*)(void *)> demangled(abi::__cxa_demangle(name, nullptr, nullptr, &status), std::free);
    return (status == 0 && demangled) ? std::string(demangled.get()) : std::string(name);
}

// Pull "code" (or "error.code") out of a JSON error body
std::string codeFromBody(const std::string &body) {
    if (body.empty()) {
        return "";
    }
    auto parsed = JsonUtils::parseJson(body);
    if (!parsed || !parsed->is_object()) {
        return "";
    }
    std::string code = JsonUtils::getString(*parsed, "code");
    if (code.empty() && parsed->contains("error") && (*parsed)["error"].is_object()) {
        code = JsonUtils::getString((*parsed)["error"], "code");
    }
    return code;
}

}  // namespace

TestErrorInfo ErrorClassifier::extract(const std::exception &error) {
    TestErrorInfo info;
    info.message = error.what();
    info.exceptionType = demangle(typeid(error).name());

    if (const auto *api = dynamic_cast<const ApiException *>(&error)) {
        info.httpStatus = api->statusCode();
        info.method = api->method();
        info.url = api->url();
        info.responseBody = api->responseBody();
        info.requestSent = api->requestSent();
        info.serverCode = codeFromBody(api->responseBody());
        info.code = !api->errorCode().empty() ? api->errorCode() : info.serverCode;
    } else if (const auto *assertion = dynamic_cast<const AssertionFailure *>(&error)) {
        info.location = assertion->location();
    }

    if (info.code.empty()) {
        info.code = codeFromMessage(info.message);
    }
    info.derivedStatus = info.httpStatus > 0 ? info.httpStatus : statusFromCode(info.code);
    return info;
}

Classification ErrorClassifier::classify(const TestErrorInfo &info) {
    Classification result;
    result.source = classifySource(info);
    result.category = categorize(info);
    result.fixLocation = fixLocation(info, result.source, result.category);
    return result;
}

ErrorSource ErrorClassifier::classifySource(const TestErrorInfo &info) {
    const bool sdkMessage = matches(info.message, kSdkMessage);

    if (!info.hasResponse() && info.requestSent &&
        (isTransportCode(info.code) || matches(info.message, kNetworkMessage))) {
        return ErrorSource::NETWORK;
    }

    if (info.hasResponse()) {
        if (info.httpStatus >= 500 || info.httpStatus == 404 || isServerCode(info.serverCode)) {
            return ErrorSource::SERVER;
        }
    }
    if (info.requestSent && !sdkMessage && matches(info.message, kServerMessage)) {
        return ErrorSource::SERVER;
    }

    if (!info.hasResponse()) {
        if (!info.requestSent || sdkMessage || startsWith(info.code, "KRAPI_") || startsWith(info.code, "SDK_")) {
            return ErrorSource::SDK;
        }
    }

    return ErrorSource::UNKNOWN;
}

ErrorCategory ErrorClassifier::categorize(const TestErrorInfo &info) {
    const int status = info.httpStatus;
    const std::string &message = info.message;

    if (status == 404 || matches(message, kMissingEndpoint)) {
        return ErrorCategory::MISSING_ENDPOINT;
    }
    if (matches(message, kMissingMethod)) {
        return ErrorCategory::MISSING_METHOD;
    }
    if (matches(message, kInvalidResponse)) {
        return ErrorCategory::INVALID_RESPONSE;
    }
    if (matches(message, kEmptyResponse)) {
        return ErrorCategory::EMPTY_RESPONSE;
    }
    if (status == 504 || info.code == "ETIMEDOUT" || matches(message, kTimeout)) {
        return ErrorCategory::TIMEOUT;
    }
    if (status >= 500) {
        return ErrorCategory::SERVER_ERROR;
    }
    if (status == 400 || status == 422 || matches(message, kValidation)) {
        return ErrorCategory::VALIDATION_ERROR;
    }
    if (status == 401 || status == 403 || matches(message, kAuth)) {
        return ErrorCategory::AUTH_ERROR;
    }
    return ErrorCategory::UNKNOWN;
}

FixLocation ErrorClassifier::fixLocation(const TestErrorInfo &info, ErrorSource source, ErrorCategory category) {
    const bool frontendRoute = info.url.find(kFrontendPrefix) != std::string::npos;

    if (source == ErrorSource::SDK && (!info.requestSent || category == ErrorCategory::MISSING_METHOD)) {
        return FixLocation::SDK;
    }
    if (info.httpStatus == 404 || category == ErrorCategory::MISSING_ENDPOINT) {
        return frontendRoute ? FixLocation::FRONTEND : FixLocation::BACKEND;
    }
    if (source == ErrorSource::SERVER || category == ErrorCategory::SERVER_ERROR || info.httpStatus >= 500) {
        return FixLocation::BACKEND;
    }
    if (source == ErrorSource::NETWORK) {
        return FixLocation::BACKEND;
    }
    if (category == ErrorCategory::INVALID_RESPONSE || category == ErrorCategory::EMPTY_RESPONSE) {
        return frontendRoute ? FixLocation::FRONTEND : FixLocation::BACKEND;
    }
    // A library exception thrown by the test body itself (bad JSON access, out_of_range)
    if (source == ErrorSource::UNKNOWN && !info.hasResponse() && info.method.empty() && info.location.empty() &&
        info.exceptionType.find("AssertionFailure") == std::string::npos) {
        return FixLocation::TEST;
    }
    return FixLocation::UNKNOWN;
}

std::string ErrorClassifier::codeFromMessage(const std::string &message) {
    static const std::vector<std::pair<std::regex, std::string>> rules = {
        {icase("already exists|duplicate"), "CONFLICT"},
        {icase("not found"), "NOT_FOUND"},
        {icase("unauthorized|invalid.*token|session.*expired"), "UNAUTHORIZED"},
        {icase("forbidden|permission|access denied"), "FORBIDDEN"},
        {icase("validation|invalid|required|missing"), "VALIDATION_ERROR"},
        {icase("rate limit|too many requests"), "RATE_LIMIT_EXCEEDED"},
        {icase("timeout"), "TIMEOUT"},
        {icase("network|connection|econnrefused|econnreset"), "NETWORK_ERROR"},
        {icase("bad request"), "BAD_REQUEST"},
        {icase("service unavailable"), "SERVICE_UNAVAILABLE"},
    };
    for (const auto &[expression, code] : rules) {
        if (matches(message, expression)) {
            return code;
        }
    }
    return "INTERNAL_ERROR";
}

int ErrorClassifier::statusFromCode(const std::string &code) {
    static const std::map<std::string, int> statuses = {
        {"UNAUTHORIZED", 401},      {"FORBIDDEN", 403},          {"NOT_FOUND", 404},
        {"VALIDATION_ERROR", 400},  {"RATE_LIMIT_EXCEEDED", 429}, {"SERVER_ERROR", 500},
        {"NETWORK_ERROR", 503},     {"TIMEOUT", 504},            {"BAD_REQUEST", 400},
        {"CONFLICT", 409},          {"UNPROCESSABLE_ENTITY", 422}, {"INTERNAL_ERROR", 500},
        {"SERVICE_UNAVAILABLE", 503}, {"REQUEST_ERROR", 400},    {"ECONNREFUSED", 503},
        {"ECONNRESET", 503},        {"ENOTFOUND", 503},          {"ETIMEDOUT", 504},
    };
    auto it = statuses.find(code);
    return it != statuses.end() ? it->second : 500;
}

}  // namespace TOE

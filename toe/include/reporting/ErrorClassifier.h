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

#include <exception>
#include <string>

namespace TOE {

enum class ErrorSource { SDK, SERVER, NETWORK, UNKNOWN };

enum class ErrorCategory {
    MISSING_ENDPOINT,
    MISSING_METHOD,
    INVALID_RESPONSE,
    EMPTY_RESPONSE,
    TIMEOUT,
    SERVER_ERROR,
    VALIDATION_ERROR,
    AUTH_ERROR,
    UNKNOWN
};

enum class FixLocation { SDK, BACKEND, FRONTEND, TEST, UNKNOWN };

const char *toString(ErrorSource source);
const char *toString(ErrorCategory category);
const char *toString(FixLocation location);

/**
 * @brief Facts pulled out of a failed test's exception
 *
 * httpStatus is the status actually received (0 = no response).
 * derivedStatus is reporting-only: the received status, or one inferred
 * from the error code when nothing was received.
 */
struct TestErrorInfo {
    std::string message;
    std::string exceptionType;
    std::string code;           // transport code, server code, or code derived from the message
    std::string serverCode;     // code reported in the response body, if any
    int httpStatus = 0;
    int derivedStatus = 0;
    std::string method;
    std::string url;
    std::string responseBody;
    bool requestSent = true;    // false: rejected client-side before any I/O
    std::string location;       // file:line of a failed check, if known

    bool hasResponse() const {
        return httpStatus > 0;
    }
};

struct Classification {
    ErrorSource source = ErrorSource::UNKNOWN;
    ErrorCategory category = ErrorCategory::UNKNOWN;
    FixLocation fixLocation = FixLocation::UNKNOWN;
};

/**
 * @brief Advisory triage of test failures
 *
 * Source priority: NETWORK (no response and a connect/timeout signature),
 * SERVER (5xx, 404, or a server-side error code), SDK (client-library
 * failure before any request left the process), otherwise UNKNOWN.
 * Derived codes and statuses never influence the source.
 */
class ErrorClassifier {
public:
    /**
     * @brief Collect everything known about an exception escaping a test body
     */
    static TestErrorInfo extract(const std::exception &error);

    static Classification classify(const TestErrorInfo &info);

    static ErrorSource classifySource(const TestErrorInfo &info);
    static ErrorCategory categorize(const TestErrorInfo &info);
    static FixLocation fixLocation(const TestErrorInfo &info, ErrorSource source, ErrorCategory category);

    /**
     * @brief Map a free-text error message onto a symbolic code (INTERNAL_ERROR when nothing matches)
     */
    static std::string codeFromMessage(const std::string &message);

    /**
     * @brief Conventional HTTP status for a symbolic code (500 when unknown)
     */
    static int statusFromCode(const std::string &code);
};

}  // namespace TOE

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

#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace TOE {

/**
 * @brief Last health observation for one supervised service
 */
struct ServiceDiagnostic {
    std::string service;
    std::string healthUrl;
    int lastStatus = 0;  // 0 = no HTTP response
    std::string lastError;
    bool alive = false;
};

/**
 * @brief The system under test could not be reached, started or authenticated against
 */
struct SetupError {
    std::string message;
    std::vector<ServiceDiagnostic> services;
};

/**
 * @brief A preparation command (install, build) exited unsuccessfully
 */
struct BuildFailure {
    std::string step;     // "install", "backend", ...
    std::string command;
    int exitCode = -1;    // -1 when the shell could not be started
    std::string output;   // combined stdout/stderr
};

/**
 * @brief A supervised service emitted a fatal signature or exited on its own
 */
struct ProcessCrash {
    std::string service;
    std::string signature;  // empty when detected by exit
    std::string line;
    int exitCode = -1;
};

/**
 * @brief One test body failed (assertion or unexpected exception)
 */
struct TestFailure {
    std::string group;
    std::string test;
    std::string message;
};

/**
 * @brief An exception escaped a group's execution wrapper
 */
struct SuiteFailure {
    std::string group;
    std::string message;
};

/**
 * @brief A cleanup target survived every retry
 */
struct CleanupWarning {
    std::string path;
    std::string reason;
    int attempts = 0;
};

using HarnessError = std::variant<SetupError, ProcessCrash, TestFailure, SuiteFailure, CleanupWarning>;

/**
 * @brief One-line human readable rendering of any failure kind
 */
std::string describe(const HarnessError &error);

/**
 * @brief Propagates a SetupError to the composition root
 */
class SetupException : public std::runtime_error {
public:
    explicit SetupException(SetupError error);

    const SetupError &error() const {
        return error_;
    }

private:
    SetupError error_;
};

/**
 * @brief Setup failure caused by a preparation command; keeps the command output
 */
class BuildException : public SetupException {
public:
    explicit BuildException(BuildFailure failure);

    const BuildFailure &failure() const {
        return failure_;
    }

private:
    BuildFailure failure_;
};

/**
 * @brief Propagates a ProcessCrash to the composition root
 */
class ProcessCrashException : public std::runtime_error {
public:
    explicit ProcessCrashException(ProcessCrash crash);

    const ProcessCrash &crash() const {
        return crash_;
    }

private:
    ProcessCrash crash_;
};

/**
 * @brief Invalid harness configuration (unknown group, dependency cycle, bad CLI value)
 */
class ConfigurationException : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * @brief Failure raised by the target-system API client
 *
 * statusCode is 0 when no HTTP response was received; errorCode then holds
 * the transport error (ECONNREFUSED, ETIMEDOUT, ...). requestSent is false
 * when the client rejected the call before anything left the process.
 */
class ApiException : public std::runtime_error {
public:
    ApiException(const std::string &message, int statusCode, std::string errorCode, std::string method,
                 std::string url, std::string responseBody = "", bool requestSent = true);

    int statusCode() const {
        return statusCode_;
    }

    const std::string &errorCode() const {
        return errorCode_;
    }

    const std::string &method() const {
        return method_;
    }

    const std::string &url() const {
        return url_;
    }

    const std::string &responseBody() const {
        return responseBody_;
    }

    bool requestSent() const {
        return requestSent_;
    }

private:
    int statusCode_;
    std::string errorCode_;
    std::string method_;
    std::string url_;
    std::string responseBody_;
    bool requestSent_;
};

/**
 * @brief A check inside a test body did not hold
 */
class AssertionFailure : public std::runtime_error {
public:
    AssertionFailure(const std::string &message, std::string location)
        : std::runtime_error(message), location_(std::move(location)) {}

    const std::string &location() const {
        return location_;
    }

private:
    std::string location_;
};

/**
 * @brief Unwinds the scheduler out of the current group
 *
 * Thrown by the suite context when stop-on-first-failure trips or a stop
 * was requested (signal, crash). Only TestScheduler catches it.
 */
class StopRequested : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace TOE

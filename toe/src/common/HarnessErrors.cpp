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

#include "common/HarnessErrors.h"
#include <sstream>

namespace TOE {

namespace {

std::string renderSetup(const SetupError &error) {
    std::ostringstream out;
    out << "SetupError: " << error.message;
    for (const auto &service : error.services) {
        out << " [" << service.service << ": status=" << service.lastStatus
            << " alive=" << (service.alive ? "true" : "false");
        if (!service.lastError.empty()) {
            out << " error=" << service.lastError;
        }
        out << "]";
    }
    return out.str();
}

std::string renderCrash(const ProcessCrash &crash) {
    std::ostringstream out;
    out << "ProcessCrash: " << crash.service;
    if (!crash.signature.empty()) {
        out << " emitted '" << crash.signature << "': " << crash.line;
    } else {
        out << " exited with code " << crash.exitCode;
    }
    return out.str();
}

struct Describer {
    std::string operator()(const SetupError &error) const {
        return renderSetup(error);
    }

    std::string operator()(const ProcessCrash &crash) const {
        return renderCrash(crash);
    }

    std::string operator()(const TestFailure &failure) const {
        return "TestFailure: " + failure.group + "/" + failure.test + ": " + failure.message;
    }

    std::string operator()(const SuiteFailure &failure) const {
        return "SuiteFailure: " + failure.group + ": " + failure.message;
    }

    std::string operator()(const CleanupWarning &warning) const {
        return "CleanupWarning: " + warning.path + " (" + std::to_string(warning.attempts) +
               " attempts): " + warning.reason;
    }
};

}  // namespace

std::string describe(const HarnessError &error) {
    return std::visit(Describer{}, error);
}

SetupException::SetupException(SetupError error)
    : std::runtime_error(renderSetup(error)), error_(std::move(error)) {}

BuildException::BuildException(BuildFailure failure)
    : SetupException(SetupError{"Build step '" + failure.step + "' failed (exit " + std::to_string(failure.exitCode) +
                                "): " + failure.command,
                                {}}),
      failure_(std::move(failure)) {}

ProcessCrashException::ProcessCrashException(ProcessCrash crash)
    : std::runtime_error(renderCrash(crash)), crash_(std::move(crash)) {}

ApiException::ApiException(const std::string &message, int statusCode, std::string errorCode, std::string method,
                           std::string url, std::string responseBody, bool requestSent)
    : std::runtime_error(message), statusCode_(statusCode), errorCode_(std::move(errorCode)),
      method_(std::move(method)), url_(std::move(url)), responseBody_(std::move(responseBody)),
      requestSent_(requestSent) {}

}  // namespace TOE

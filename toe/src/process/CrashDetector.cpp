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

#include "process/CrashDetector.h"

#include <algorithm>

namespace TOE {

namespace {

const std::vector<std::string> &importantPatterns() {
    static const std::vector<std::string> patterns = {
        // auth
        "AUTH DEBUG", "AUTH MIDDLEWARE", "AUTH ME", "getSessionByToken", "validateSessionToken", "authenticateAdmin",
        "Token validation", "Session found", "Session token",
        // database
        "DB DEBUG", "SDK ADAPTER", "queryMain", "queryProject", "no such table", "duplicate column", "SqliteError",
        "SQLITE_ERROR",
        // errors
        "API ERROR", "ERROR", "Error", "error:", "FAILED", "Failed", "failed",
        // client library error codes
        "KrapiError", "CONFLICT", "NOT_FOUND", "VALIDATION_ERROR", "INTERNAL_ERROR"};
    return patterns;
}

const std::vector<std::string> &harmlessPatterns() {
    static const std::vector<std::string> patterns = {"ExperimentalWarning", "DeprecationWarning",
                                                      "Unknown env config",  "Fast Refresh",
                                                      "compiled client and server", "Compiling"};
    return patterns;
}

bool containsAny(const std::string &line, const std::vector<std::string> &patterns) {
    return std::any_of(patterns.begin(), patterns.end(),
                       [&line](const std::string &pattern) { return line.find(pattern) != std::string::npos; });
}

}  // namespace

CrashDetector::CrashDetector() : fatalSignatures_(defaultFatalSignatures()) {}

CrashDetector::CrashDetector(std::vector<std::string> fatalSignatures)
    : fatalSignatures_(std::move(fatalSignatures)) {}

const std::vector<std::string> &CrashDetector::defaultFatalSignatures() {
    static const std::vector<std::string> signatures = {"throw new Error",
                                                        "TypeError",
                                                        "ReferenceError",
                                                        "SyntaxError",
                                                        "Cannot find module",
                                                        "app crashed",
                                                        "UnhandledPromiseRejection",
                                                        "uncaughtException",
                                                        "EADDRINUSE",
                                                        "UNIQUE constraint failed",
                                                        "duplicate key value violates",
                                                        "requires a valid database connection"};
    return signatures;
}

std::optional<std::string> CrashDetector::scan(const std::string &line) const {
    for (const auto &signature : fatalSignatures_) {
        if (line.find(signature) != std::string::npos) {
            return signature;
        }
    }
    return std::nullopt;
}

bool CrashDetector::isImportant(const std::string &line) {
    return containsAny(line, importantPatterns());
}

bool CrashDetector::isHarmless(const std::string &line) {
    if (containsAny(line, harmlessPatterns())) {
        return true;
    }
    // npm chatter is noise unless it reports an error
    return line.find("npm warn") != std::string::npos && line.find("error") == std::string::npos;
}

}  // namespace TOE

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

#include "common/HarnessErrors.h"
#include "reporting/ErrorClassifier.h"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace TOE {

enum class TestStatus { Passed, Failed };

inline const char *toString(TestStatus status) {
    return status == TestStatus::Passed ? "PASSED" : "FAILED";
}

/**
 * @brief Result of one executed test, immutable once recorded
 */
struct TestOutcome {
    std::string group;
    std::string name;
    TestStatus status = TestStatus::Passed;
    std::chrono::milliseconds duration{0};
    std::string timestamp;  // ISO-8601 UTC
    std::string message;
    std::optional<TestErrorInfo> error;
    Classification classification;
    std::string stack;  // truncated

    bool passed() const {
        return status == TestStatus::Passed;
    }
};

struct SuiteFailureRecord {
    SuiteFailure failure;
    std::string timestamp;
};

/**
 * @brief Error-level line emitted by a supervised service during the run
 */
struct ServiceLogEntry {
    std::string service;
    std::string stream;
    std::string message;
    std::string timestamp;
};

struct GroupStats {
    std::string name;
    std::string displayName;
    int passed = 0;
    int failed = 0;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Final aggregate of a run
 *
 * passed + failed == outcomes.size(). Suite failures are kept apart and
 * never counted as tests. successRate is measured against expectedTotal so
 * a truncated run reads as incomplete.
 */
struct RunReport {
    int passed = 0;
    int failed = 0;
    int total = 0;
    int expectedTotal = 0;
    double successRate = 0.0;
    std::chrono::milliseconds duration{0};
    std::string startedAt;
    std::string finishedAt;

    std::map<std::string, std::string> environment;
    std::vector<TestOutcome> outcomes;
    std::vector<SuiteFailureRecord> suiteFailures;
    std::vector<GroupStats> groups;
    std::vector<ServiceLogEntry> serviceLogs;
    std::optional<ProcessCrash> crash;
    std::optional<SetupError> setupError;

    std::string testProjectId;
    std::string testCollectionName;
    bool stoppedEarly = false;
    bool interrupted = false;

    std::vector<std::string> reportFiles;

    /**
     * @brief Whether the run may exit 0
     */
    bool success() const {
        return failed == 0 && suiteFailures.empty() && !crash && !setupError && !interrupted;
    }

    bool complete() const {
        return expectedTotal <= 0 || total >= expectedTotal;
    }
};

/**
 * @brief Current UTC time as 2025-01-31T12:34:56.789Z
 */
std::string isoTimestamp(std::chrono::system_clock::time_point when = std::chrono::system_clock::now());

}  // namespace TOE

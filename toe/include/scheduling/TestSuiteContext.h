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

#include "common/RunContext.h"
#include "scheduling/TestGroup.h"

#include <functional>
#include <source_location>
#include <string>

namespace TOE {

class ResultAggregator;

/**
 * @brief What a group body sees while it runs
 *
 * test() executes one test immediately, in declaration order, and records
 * its outcome. An exception from the test body is a TestFailure; it never
 * escapes test() except as StopRequested (stop-on-first-failure, or a stop
 * request) and ProcessCrashException (from the before-test hook).
 */
class TestSuiteContext {
public:
    using Hook = std::function<void()>;

    TestSuiteContext(const TestGroup &group, RunContext &run, ResultAggregator &aggregator, Hook beforeEachTest = {});

    /**
     * @brief Run one test and record its outcome
     * @throws StopRequested when the run must not continue past this point
     */
    void test(const std::string &name, const std::function<void()> &body);

    /**
     * @brief Fail the current test unless condition holds
     * @throws AssertionFailure carrying the caller's location
     */
    void check(bool condition, const std::string &message,
               std::source_location location = std::source_location::current()) const;

    SessionState &session() {
        return run_.session();
    }

    RunContext &run() {
        return run_;
    }

    const TestGroup &group() const {
        return group_;
    }

    int passed() const {
        return passed_;
    }

    int failed() const {
        return failed_;
    }

private:
    const TestGroup &group_;
    RunContext &run_;
    ResultAggregator &aggregator_;
    Hook beforeEachTest_;
    int passed_ = 0;
    int failed_ = 0;
};

}  // namespace TOE

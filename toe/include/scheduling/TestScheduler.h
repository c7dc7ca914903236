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
#include "scheduling/TestRegistry.h"
#include "scheduling/TestSuiteContext.h"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace TOE {

class ResultAggregator;

/**
 * @brief Outcome of TestScheduler::run()
 */
struct RunSummary {
    int passed = 0;
    int failed = 0;
    int total = 0;
    int suiteFailures = 0;
    bool stoppedEarly = false;  // stop-on-first-failure tripped
    bool interrupted = false;   // stop requested from outside (signal)
    std::string stopReason;
    std::vector<std::string> executedGroups;
    std::vector<std::string> skippedGroups;

    bool success() const {
        return failed == 0 && suiteFailures == 0 && !interrupted;
    }
};

/**
 * @brief Resolves the groups to run and executes them against the live system
 *
 * Execution order is the dependency closure of the selection (see
 * TestRegistry::resolveTestDependencies). Groups pulled in only as
 * dependencies run without a banner. An exception escaping a group body is
 * a suite failure; in stop-on-first-failure mode it also ends the run.
 *
 * SetupException and ProcessCrashException propagate to the caller.
 */
class TestScheduler {
public:
    using SessionSetupHook = std::function<void(const InitRequirements &)>;
    using TestHook = std::function<void()>;

    TestScheduler(const TestRegistry &registry, RunContext &run, ResultAggregator &aggregator);

    /**
     * @brief One-time setup for the union of requirements of the planned groups
     */
    void setSessionSetup(SessionSetupHook hook);

    /**
     * @brief Runs before every test, e.g. to abort on a service crash
     */
    void setBeforeEachTest(TestHook hook);

    /**
     * @brief Groups that run() would execute, in order
     * @param selected nullopt runs the whole registry
     * @throws ConfigurationException on unknown groups or cycles
     */
    std::vector<std::string> plan(const std::optional<std::vector<std::string>> &selected) const;

    RunSummary run(const std::optional<std::vector<std::string>> &selected = std::nullopt);

private:
    const TestRegistry &registry_;
    RunContext &run_;
    ResultAggregator &aggregator_;
    SessionSetupHook sessionSetup_;
    TestHook beforeEachTest_;
};

}  // namespace TOE

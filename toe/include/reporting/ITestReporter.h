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

#include "reporting/TestOutcome.h"

#include <string>

namespace TOE {

/**
 * @brief Interface for presenting test results while a run progresses
 *
 * Strategy Pattern: the aggregator fans every event out to its reporters;
 * persistence is handled separately by ReportWriter.
 */
class ITestReporter {
public:
    virtual ~ITestReporter() = default;

    /**
     * @brief A group is about to execute
     * @param silent Group runs only as a dependency of a selected group (no banner)
     */
    virtual void beginGroup(const std::string &group, const std::string &displayName, bool silent) = 0;

    /**
     * @brief Report result of a single test
     */
    virtual void reportOutcome(const TestOutcome &outcome) = 0;

    virtual void reportSuiteFailure(const SuiteFailureRecord &failure) = 0;

    /**
     * @brief Generate final summary report
     * @param report Finalized run statistics
     */
    virtual void generateSummary(const RunReport &report) = 0;

    /**
     * @brief Get output destination (file path, console, etc.)
     */
    virtual std::string getOutputDestination() const = 0;
};

}  // namespace TOE

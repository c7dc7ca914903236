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
#include "reporting/ITestReporter.h"

namespace TOE {

/**
 * @brief Logger-backed progress output
 *
 * Terse mode prints group banners, failures and the summary. Verbose mode
 * adds every passed test (unless hidePassed) and failure triage details.
 */
class ConsoleTestReporter : public ITestReporter {
public:
    explicit ConsoleTestReporter(RunOptions options);

    void beginGroup(const std::string &group, const std::string &displayName, bool silent) override;
    void reportOutcome(const TestOutcome &outcome) override;
    void reportSuiteFailure(const SuiteFailureRecord &failure) override;
    void generateSummary(const RunReport &report) override;

    std::string getOutputDestination() const override {
        return "Console";
    }

private:
    RunOptions options_;
    size_t testCount_ = 0;
};

}  // namespace TOE

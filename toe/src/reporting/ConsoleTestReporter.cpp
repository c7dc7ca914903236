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

#include "reporting/ConsoleTestReporter.h"
#include "common/Logger.h"

namespace TOE {

ConsoleTestReporter::ConsoleTestReporter(RunOptions options) : options_(options) {}

void ConsoleTestReporter::beginGroup([[maybe_unused]] const std::string &group, const std::string &displayName,
                                     bool silent) {
    if (silent) {
        return;
    }
    LOG_INFO("=== {} ===", displayName);
}

void ConsoleTestReporter::reportOutcome(const TestOutcome &outcome) {
    ++testCount_;

    if (outcome.passed()) {
        if (options_.verbose && !options_.hidePassed) {
            LOG_INFO("[{}] PASS {}/{} ({}ms)", testCount_, outcome.group, outcome.name, outcome.duration.count());
        }
        return;
    }

    LOG_ERROR("[{}] FAIL {}/{}: {}", testCount_, outcome.group, outcome.name, outcome.message);
    if (options_.verbose) {
        LOG_INFO(" - source={} category={} fix={}", toString(outcome.classification.source),
                 toString(outcome.classification.category), toString(outcome.classification.fixLocation));
        if (outcome.error && outcome.error->hasResponse()) {
            LOG_INFO(" - {} {} -> {}", outcome.error->method, outcome.error->url, outcome.error->httpStatus);
        }
        if (!outcome.stack.empty()) {
            LOG_INFO(" - at {}", outcome.stack);
        }
    }
}

void ConsoleTestReporter::reportSuiteFailure(const SuiteFailureRecord &failure) {
    LOG_ERROR("Suite '{}' failed: {}", failure.failure.group, failure.failure.message);
}

void ConsoleTestReporter::generateSummary(const RunReport &report) {
    LOG_INFO("=== Test Summary ===");
    for (const auto &group : report.groups) {
        LOG_INFO("  {:<24} passed={} failed={} ({}ms)", group.displayName, group.passed, group.failed,
                 group.duration.count());
    }

    LOG_INFO("Total: {} / expected {} | Passed: {} | Failed: {} | Success rate: {:.1f}%", report.total,
             report.expectedTotal, report.passed, report.failed, report.successRate);
    LOG_INFO("Duration: {}ms", report.duration.count());

    if (!report.complete()) {
        LOG_WARN("Run incomplete: {} of {} expected tests executed", report.total, report.expectedTotal);
    }
    if (!report.suiteFailures.empty()) {
        LOG_ERROR("Suite-level failures: {}", report.suiteFailures.size());
    }
    if (report.setupError) {
        LOG_ERROR("{}", describe(HarnessError{*report.setupError}));
    }
    if (report.crash) {
        LOG_ERROR("{}", describe(HarnessError{*report.crash}));
    }
    if (report.interrupted) {
        LOG_WARN("Run interrupted before completion");
    }
    for (const auto &file : report.reportFiles) {
        LOG_INFO("Report written: {}", file);
    }

    if (report.success()) {
        LOG_INFO("All tests passed");
    } else {
        LOG_ERROR("Run FAILED");
    }
}

}  // namespace TOE

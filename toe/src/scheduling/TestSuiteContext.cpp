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

#include "scheduling/TestSuiteContext.h"
#include "common/HarnessErrors.h"
#include "common/Logger.h"
#include "common/StringUtils.h"
#include "reporting/ErrorClassifier.h"
#include "reporting/ResultAggregator.h"

#include <chrono>
#include <filesystem>

namespace TOE {

namespace {

constexpr size_t MAX_STACK_LINES = 10;

}  // namespace

TestSuiteContext::TestSuiteContext(const TestGroup &group, RunContext &run, ResultAggregator &aggregator,
                                   Hook beforeEachTest)
    : group_(group), run_(run), aggregator_(aggregator), beforeEachTest_(std::move(beforeEachTest)) {}

void TestSuiteContext::test(const std::string &name, const std::function<void()> &body) {
    if (run_.stopRequested()) {
        throw StopRequested("Stop requested before " + group_.name + "/" + name);
    }
    if (beforeEachTest_) {
        beforeEachTest_();
    }

    int attempt = run_.noteTestAttempted();
    LOG_DEBUG("Running test #{} {}/{}", attempt, group_.name, name);

    TestOutcome outcome;
    outcome.group = group_.name;
    outcome.name = name;
    outcome.timestamp = isoTimestamp();
    auto started = std::chrono::steady_clock::now();

    try {
        body();
        outcome.status = TestStatus::Passed;
    } catch (const ProcessCrashException &) {
        throw;
    } catch (const StopRequested &) {
        throw;
    } catch (const std::exception &e) {
        TestErrorInfo info = ErrorClassifier::extract(e);
        outcome.status = TestStatus::Failed;
        outcome.message = info.message;
        outcome.classification = ErrorClassifier::classify(info);
        std::string trace = info.location.empty() ? info.exceptionType : info.location + "\n" + info.exceptionType;
        outcome.stack = truncateLines(trace, MAX_STACK_LINES);
        outcome.error = std::move(info);
    } catch (...) {
        LOG_ERROR("Test {}/{} threw a non-standard exception", group_.name, name);
        outcome.status = TestStatus::Failed;
        outcome.message = "unknown exception";
    }

    outcome.duration =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    const bool failed = !outcome.passed();
    const std::string message = outcome.message;
    aggregator_.record(std::move(outcome));

    if (!failed) {
        passed_++;
        return;
    }
    failed_++;
    if (run_.options().stopOnFirstFailure) {
        throw StopRequested("Stopping after first failure: " + group_.name + "/" + name + ": " + message);
    }
}

void TestSuiteContext::check(bool condition, const std::string &message, std::source_location location) const {
    if (condition) {
        return;
    }
    std::string where = fmt::format("{}:{} ({})", std::filesystem::path(location.file_name()).filename().string(),
                                    location.line(), location.function_name());
    throw AssertionFailure(message, where);
}

}  // namespace TOE

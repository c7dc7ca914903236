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

#include "process/OutputChannel.h"
#include "reporting/ITestReporter.h"
#include "reporting/ReportWriter.h"
#include "reporting/TestOutcome.h"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace TOE {

/**
 * @brief Accumulates outcomes for one run and produces the final report
 *
 * The outcome log is append-only. Suite failures are tracked beside it and
 * never counted as tests. finalize() computes the summary, writes the
 * report file set once and returns the same report on every later call.
 *
 * captureOutput() is called from service reader threads; every other
 * member is driven by the control thread.
 */
class ResultAggregator {
public:
    /**
     * @param expectedTotal Test count of a full run, the success-rate baseline
     * @param writer Persists the report; nullptr keeps results in memory only
     */
    ResultAggregator(int expectedTotal, std::unique_ptr<ReportWriter> writer);

    void addReporter(std::shared_ptr<ITestReporter> reporter);

    void beginGroup(const std::string &group, const std::string &displayName, bool silent);

    /**
     * @brief Append one test outcome
     *
     * Ignored (with a warning) once the aggregator is finalized.
     */
    void record(TestOutcome outcome);

    void recordSuiteFailure(SuiteFailure failure);
    void recordGroupDuration(const std::string &group, std::chrono::milliseconds duration);

    void recordSetupError(SetupError error);
    void recordCrash(ProcessCrash crash);
    void markStoppedEarly();
    void markInterrupted();

    /**
     * @brief Keep a service output line for the transcript
     * @param important Line also lands in the report's service error log
     */
    void captureOutput(const std::string &service, const OutputLine &line, bool important);

    void setEnvironment(std::map<std::string, std::string> environment);
    void setTestProject(const std::string &projectId, const std::string &collectionName);

    /**
     * @brief Compute the summary and persist the report file set
     *
     * Idempotent: later calls return the first report and write nothing.
     */
    const RunReport &finalize();

    bool finalized() const;

    int passed() const;
    int failed() const;
    int total() const;

    int expectedTotal() const {
        return expectedTotal_;
    }

    std::vector<TestOutcome> outcomes() const;
    std::vector<SuiteFailureRecord> suiteFailures() const;
    std::vector<std::string> transcript() const;

private:
    GroupStats &statsFor(const std::string &group);

    const int expectedTotal_;
    std::unique_ptr<ReportWriter> writer_;
    std::vector<std::shared_ptr<ITestReporter>> reporters_;
    std::chrono::steady_clock::time_point started_;
    std::string startedAt_;

    mutable std::mutex mutex_;
    RunReport report_;
    std::vector<std::string> transcript_;
    bool finalized_ = false;
};

}  // namespace TOE

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

#include "reporting/ResultAggregator.h"
#include "common/Logger.h"

#include <algorithm>

namespace TOE {

ResultAggregator::ResultAggregator(int expectedTotal, std::unique_ptr<ReportWriter> writer)
    : expectedTotal_(expectedTotal), writer_(std::move(writer)), started_(std::chrono::steady_clock::now()),
      startedAt_(isoTimestamp()) {
    report_.expectedTotal = expectedTotal_;
    report_.startedAt = startedAt_;
}

void ResultAggregator::addReporter(std::shared_ptr<ITestReporter> reporter) {
    if (reporter) {
        reporters_.push_back(std::move(reporter));
    }
}

GroupStats &ResultAggregator::statsFor(const std::string &group) {
    auto it = std::find_if(report_.groups.begin(), report_.groups.end(),
                           [&group](const GroupStats &stats) { return stats.name == group; });
    if (it != report_.groups.end()) {
        return *it;
    }
    GroupStats stats;
    stats.name = group;
    stats.displayName = group;
    report_.groups.push_back(stats);
    return report_.groups.back();
}

void ResultAggregator::beginGroup(const std::string &group, const std::string &displayName, bool silent) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        statsFor(group).displayName = displayName.empty() ? group : displayName;
    }
    for (const auto &reporter : reporters_) {
        reporter->beginGroup(group, displayName, silent);
    }
}

void ResultAggregator::record(TestOutcome outcome) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (finalized_) {
            LOG_WARN("ResultAggregator: Ignoring outcome {}/{} recorded after finalize", outcome.group, outcome.name);
            return;
        }
        if (outcome.timestamp.empty()) {
            outcome.timestamp = isoTimestamp();
        }
        auto &stats = statsFor(outcome.group);
        if (outcome.passed()) {
            stats.passed++;
            report_.passed++;
        } else {
            stats.failed++;
            report_.failed++;
        }
        report_.outcomes.push_back(outcome);
        report_.total = static_cast<int>(report_.outcomes.size());
    }
    for (const auto &reporter : reporters_) {
        reporter->reportOutcome(outcome);
    }
}

void ResultAggregator::recordSuiteFailure(SuiteFailure failure) {
    SuiteFailureRecord record{std::move(failure), isoTimestamp()};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (finalized_) {
            LOG_WARN("ResultAggregator: Ignoring suite failure of {} recorded after finalize", record.failure.group);
            return;
        }
        report_.suiteFailures.push_back(record);
    }
    for (const auto &reporter : reporters_) {
        reporter->reportSuiteFailure(record);
    }
}

void ResultAggregator::recordGroupDuration(const std::string &group, std::chrono::milliseconds duration) {
    std::lock_guard<std::mutex> lock(mutex_);
    statsFor(group).duration = duration;
}

void ResultAggregator::recordSetupError(SetupError error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!report_.setupError) {
        report_.setupError = std::move(error);
    }
}

void ResultAggregator::recordCrash(ProcessCrash crash) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!report_.crash) {
        report_.crash = std::move(crash);
    }
}

void ResultAggregator::markStoppedEarly() {
    std::lock_guard<std::mutex> lock(mutex_);
    report_.stoppedEarly = true;
}

void ResultAggregator::markInterrupted() {
    std::lock_guard<std::mutex> lock(mutex_);
    report_.interrupted = true;
}

void ResultAggregator::captureOutput(const std::string &service, const OutputLine &line, bool important) {
    std::string timestamp = isoTimestamp(line.timestamp);
    std::lock_guard<std::mutex> lock(mutex_);
    transcript_.push_back("[" + timestamp + "] [" + service + ":" + toString(line.stream) + "] " + line.text);
    if (important && !finalized_) {
        report_.serviceLogs.push_back({service, toString(line.stream), line.text, timestamp});
    }
}

void ResultAggregator::setEnvironment(std::map<std::string, std::string> environment) {
    std::lock_guard<std::mutex> lock(mutex_);
    report_.environment = std::move(environment);
}

void ResultAggregator::setTestProject(const std::string &projectId, const std::string &collectionName) {
    std::lock_guard<std::mutex> lock(mutex_);
    report_.testProjectId = projectId;
    report_.testCollectionName = collectionName;
}

const RunReport &ResultAggregator::finalize() {
    std::vector<std::string> transcript;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (finalized_) {
            LOG_DEBUG("ResultAggregator: Already finalized, skipping");
            return report_;
        }
        finalized_ = true;

        report_.total = static_cast<int>(report_.outcomes.size());
        report_.duration =
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_);
        report_.finishedAt = isoTimestamp();
        int baseline = expectedTotal_ > 0 ? expectedTotal_ : report_.total;
        report_.successRate = baseline > 0 ? (100.0 * report_.passed) / baseline : 0.0;
        transcript = transcript_;
    }

    // report_ is frozen from here on; only reportFiles is filled in
    if (writer_) {
        report_.reportFiles = writer_->write(report_, transcript);
    }
    for (const auto &reporter : reporters_) {
        reporter->generateSummary(report_);
    }
    return report_;
}

bool ResultAggregator::finalized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finalized_;
}

int ResultAggregator::passed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return report_.passed;
}

int ResultAggregator::failed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return report_.failed;
}

int ResultAggregator::total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return report_.total;
}

std::vector<TestOutcome> ResultAggregator::outcomes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return report_.outcomes;
}

std::vector<SuiteFailureRecord> ResultAggregator::suiteFailures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return report_.suiteFailures;
}

std::vector<std::string> ResultAggregator::transcript() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transcript_;
}

}  // namespace TOE

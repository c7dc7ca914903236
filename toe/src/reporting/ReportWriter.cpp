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

#include "reporting/ReportWriter.h"
#include "common/Logger.h"

#include <ctime>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace TOE {

namespace {

json errorToJson(const TestErrorInfo &error) {
    json out = {{"message", error.message},
                {"type", error.exceptionType},
                {"code", error.code},
                {"status", error.derivedStatus},
                {"requestSent", error.requestSent}};
    if (error.hasResponse()) {
        out["httpStatus"] = error.httpStatus;
    }
    if (!error.method.empty()) {
        out["method"] = error.method;
        out["url"] = error.url;
    }
    if (!error.serverCode.empty()) {
        out["serverCode"] = error.serverCode;
    }
    if (!error.responseBody.empty()) {
        out["responseBody"] = error.responseBody;
    }
    if (!error.location.empty()) {
        out["location"] = error.location;
    }
    return out;
}

json outcomeToJson(const TestOutcome &outcome) {
    json out = {{"group", outcome.group},
                {"name", outcome.name},
                {"status", toString(outcome.status)},
                {"duration", outcome.duration.count()},
                {"timestamp", outcome.timestamp}};
    if (!outcome.passed()) {
        out["message"] = outcome.message;
        out["source"] = toString(outcome.classification.source);
        out["category"] = toString(outcome.classification.category);
        out["fixLocation"] = toString(outcome.classification.fixLocation);
        if (outcome.error) {
            out["error"] = errorToJson(*outcome.error);
        }
        if (!outcome.stack.empty()) {
            out["stack"] = outcome.stack;
        }
    }
    return out;
}

json diagnosticsToJson(const std::vector<ServiceDiagnostic> &services) {
    json out = json::array();
    for (const auto &service : services) {
        out.push_back({{"service", service.service},
                       {"healthUrl", service.healthUrl},
                       {"lastStatus", service.lastStatus},
                       {"lastError", service.lastError},
                       {"alive", service.alive}});
    }
    return out;
}

void writeHeader(std::ostringstream &out, const RunReport &report) {
    out << "Test run " << report.startedAt << " - " << report.finishedAt << "\n";
    out << "Total: " << report.total << " / expected " << report.expectedTotal << "\n";
    out << "Passed: " << report.passed << "\n";
    out << "Failed: " << report.failed << "\n";
    out << "Success rate: " << fmt::format("{:.1f}", report.successRate) << "%\n";
    out << "Duration: " << report.duration.count() << "ms\n";
    if (!report.complete()) {
        out << "INCOMPLETE: " << report.total << " of " << report.expectedTotal << " expected tests executed\n";
    }
    if (report.stoppedEarly) {
        out << "Stopped early after first failure\n";
    }
    if (report.interrupted) {
        out << "Interrupted\n";
    }
    if (report.setupError) {
        out << describe(HarnessError{*report.setupError}) << "\n";
    }
    if (report.crash) {
        out << describe(HarnessError{*report.crash}) << "\n";
    }
    out << "Result: " << (report.success() ? "SUCCESS" : "FAILURE") << "\n";
}

const std::string RULE(80, '=');
const std::string SECTION_RULE(80, '-');

void writeSection(std::ostringstream &out, const std::string &title, const std::string &body) {
    out << title << "\n" << SECTION_RULE << "\n" << body << "\n\n";
}

void writeFailure(std::ostringstream &out, const TestOutcome &outcome) {
    out << "  [" << outcome.group << "] " << outcome.name << "\n";
    out << "    Message: " << outcome.message << "\n";
    out << "    Category: " << toString(outcome.classification.category)
        << "  Fix in: " << toString(outcome.classification.fixLocation) << "\n";
    if (outcome.error) {
        const auto &error = *outcome.error;
        out << "    Code: " << error.code << "  Status: " << error.derivedStatus
            << (error.hasResponse() ? "" : " (derived)") << "\n";
        if (!error.method.empty()) {
            out << "    Request: " << error.method << " " << error.url << "\n";
        }
        if (!error.responseBody.empty()) {
            out << "    Response: " << error.responseBody << "\n";
        }
    }
    if (!outcome.stack.empty()) {
        out << "    Stack:\n      " << outcome.stack << "\n";
    }
}

}  // namespace

ReportWriter::ReportWriter(std::filesystem::path reportsDir, bool writeTranscript)
    : reportsDir_(std::move(reportsDir)), writeTranscript_(writeTranscript) {}

std::string ReportWriter::fileTimestamp(std::chrono::system_clock::time_point when) {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count() % 1000;
    std::time_t seconds = std::chrono::system_clock::to_time_t(when);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H-%M-%S", &utc);
    return fmt::format("{}-{:03d}Z", buffer, static_cast<int>(millis));
}

std::string ReportWriter::uniqueStamp(const std::string &stamp) const {
    auto taken = [this](const std::string &candidate) {
        return std::filesystem::exists(reportsDir_ / ("test-results-" + candidate + ".json")) ||
               std::filesystem::exists(reportsDir_ / ("test-errors-" + candidate + ".txt"));
    };
    if (!taken(stamp)) {
        return stamp;
    }
    for (int suffix = 1;; ++suffix) {
        std::string candidate = stamp + "-" + std::to_string(suffix);
        if (!taken(candidate)) {
            return candidate;
        }
    }
}

void ReportWriter::writeAtomically(const std::filesystem::path &path, const std::string &content) {
    auto temporary = path;
    temporary += ".tmp";
    {
        std::ofstream out(temporary, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("cannot open " + temporary.string());
        }
        out << content;
        if (!out.flush()) {
            throw std::runtime_error("cannot write " + temporary.string());
        }
    }
    std::filesystem::rename(temporary, path);
}

std::vector<std::string> ReportWriter::write(const RunReport &report,
                                             const std::vector<std::string> &transcript) noexcept {
    std::vector<std::string> written;
    try {
        std::filesystem::create_directories(reportsDir_);
        const std::string stamp = uniqueStamp(fileTimestamp(std::chrono::system_clock::now()));

        RunReport withFiles = report;
        const auto jsonPath = reportsDir_ / ("test-results-" + stamp + ".json");
        const auto textPath = reportsDir_ / ("test-results-" + stamp + ".txt");
        const auto errorsPath = reportsDir_ / ("test-errors-" + stamp + ".txt");
        const auto transcriptPath = reportsDir_ / ("test-full-output-" + stamp + ".txt");
        const bool withTranscript = writeTranscript_ && !transcript.empty();

        withFiles.reportFiles = {jsonPath.string(), textPath.string(), errorsPath.string()};
        if (withTranscript) {
            withFiles.reportFiles.push_back(transcriptPath.string());
        }

        writeAtomically(jsonPath, JsonUtils::toPrettyString(toJson(withFiles)));
        written.push_back(jsonPath.string());

        writeAtomically(textPath, renderNarrative(withFiles));
        written.push_back(textPath.string());

        writeAtomically(errorsPath, renderErrors(withFiles));
        written.push_back(errorsPath.string());

        if (withTranscript) {
            std::ostringstream out;
            for (const auto &line : transcript) {
                out << line << "\n";
            }
            writeAtomically(transcriptPath, out.str());
            written.push_back(transcriptPath.string());
        }
    } catch (const std::exception &e) {
        LOG_ERROR("ReportWriter: Failed to write reports to {}: {}", reportsDir_.string(), e.what());
    }
    return written;
}

std::string ReportWriter::writeArtifact(const std::string &prefix, const std::string &content) noexcept {
    try {
        std::filesystem::create_directories(reportsDir_);
        const std::string stamp = fileTimestamp(std::chrono::system_clock::now());
        auto path = reportsDir_ / (prefix + "-" + stamp + ".txt");
        for (int suffix = 1; std::filesystem::exists(path); ++suffix) {
            path = reportsDir_ / (prefix + "-" + stamp + "-" + std::to_string(suffix) + ".txt");
        }
        writeAtomically(path, content);
        LOG_INFO("ReportWriter: {} written to {}", prefix, path.string());
        return path.string();
    } catch (const std::exception &e) {
        LOG_ERROR("ReportWriter: Failed to write {} to {}: {}", prefix, reportsDir_.string(), e.what());
        return "";
    }
}

std::string ReportWriter::writeBuildError(const BuildFailure &failure) noexcept {
    std::string content;
    try {
        content = renderBuildError(failure, isoTimestamp());
    } catch (const std::exception &e) {
        LOG_ERROR("ReportWriter: Failed to render build error: {}", e.what());
        return "";
    }
    return writeArtifact("build-error", content);
}

std::string ReportWriter::writeFatalError(const std::string &message, std::chrono::milliseconds duration) noexcept {
    std::string content;
    try {
        content = renderFatalError(message, duration, isoTimestamp());
    } catch (const std::exception &e) {
        LOG_ERROR("ReportWriter: Failed to render fatal error: {}", e.what());
        return "";
    }
    return writeArtifact("fatal-error", content);
}

std::string ReportWriter::renderBuildError(const BuildFailure &failure, const std::string &timestamp) {
    std::ostringstream out;
    out << RULE << "\nBUILD ERROR\n" << RULE << "\n\n";
    out << "Timestamp: " << timestamp << "\n\n";
    out << "Build Step: " << failure.step << "\n";
    out << "Build Command: " << failure.command << "\n";
    out << "Exit Code: " << failure.exitCode << "\n\n";
    if (!failure.output.empty()) {
        writeSection(out, "BUILD OUTPUT", failure.output);
    }
    out << RULE << "\nEND OF BUILD ERROR REPORT\n" << RULE << "\n";
    return out.str();
}

std::string ReportWriter::renderFatalError(const std::string &message, std::chrono::milliseconds duration,
                                           const std::string &timestamp) {
    std::ostringstream out;
    out << RULE << "\nFATAL ERROR\n" << RULE << "\n\n";
    out << "Timestamp: " << timestamp << "\n";
    out << "Duration: " << duration.count() << "ms\n\n";
    writeSection(out, "ERROR MESSAGE", message);
    out << "The run ended before its report could be completed.\n";
    out << RULE << "\nEND OF FATAL ERROR REPORT\n" << RULE << "\n";
    return out.str();
}

json ReportWriter::toJson(const RunReport &report) {
    json summary = {{"total", report.total},
                    {"passed", report.passed},
                    {"failed", report.failed},
                    {"expectedTotal", report.expectedTotal},
                    {"successRate", report.successRate},
                    {"duration", report.duration.count()},
                    {"startedAt", report.startedAt},
                    {"finishedAt", report.finishedAt},
                    {"stoppedEarly", report.stoppedEarly},
                    {"interrupted", report.interrupted},
                    {"complete", report.complete()},
                    {"success", report.success()}};

    json groups = json::array();
    for (const auto &group : report.groups) {
        groups.push_back({{"name", group.name},
                          {"displayName", group.displayName},
                          {"passed", group.passed},
                          {"failed", group.failed},
                          {"duration", group.duration.count()}});
    }

    json tests = json::array();
    for (const auto &outcome : report.outcomes) {
        tests.push_back(outcomeToJson(outcome));
    }

    json suiteFailures = json::array();
    for (const auto &record : report.suiteFailures) {
        suiteFailures.push_back(
            {{"group", record.failure.group}, {"message", record.failure.message}, {"timestamp", record.timestamp}});
    }

    json serviceErrors = json::array();
    for (const auto &entry : report.serviceLogs) {
        serviceErrors.push_back({{"service", entry.service},
                                 {"stream", entry.stream},
                                 {"message", entry.message},
                                 {"timestamp", entry.timestamp}});
    }

    json out = {{"summary", summary},
                {"environment", report.environment},
                {"groups", groups},
                {"tests", tests},
                {"suiteFailures", suiteFailures},
                {"testProject", {{"id", report.testProjectId}, {"collection", report.testCollectionName}}},
                {"serviceErrors", serviceErrors},
                {"reportFiles", report.reportFiles}};

    if (report.crash) {
        out["crash"] = {{"service", report.crash->service},
                        {"signature", report.crash->signature},
                        {"line", report.crash->line},
                        {"exitCode", report.crash->exitCode}};
    }
    if (report.setupError) {
        out["setupError"] = {{"message", report.setupError->message},
                             {"services", diagnosticsToJson(report.setupError->services)}};
    }
    return out;
}

std::string ReportWriter::renderNarrative(const RunReport &report) {
    std::ostringstream out;
    writeHeader(out, report);

    if (!report.environment.empty()) {
        out << "\nEnvironment:\n";
        for (const auto &[key, value] : report.environment) {
            out << "  " << key << ": " << value << "\n";
        }
    }
    if (!report.testProjectId.empty()) {
        out << "Test project: " << report.testProjectId << "  collection: " << report.testCollectionName << "\n";
    }

    out << "\nGroups:\n";
    for (const auto &group : report.groups) {
        out << "  " << group.displayName << ": passed=" << group.passed << " failed=" << group.failed << " ("
            << group.duration.count() << "ms)\n";
    }

    std::string currentGroup;
    out << "\nTests:\n";
    for (const auto &outcome : report.outcomes) {
        if (outcome.group != currentGroup) {
            currentGroup = outcome.group;
            out << " " << currentGroup << "\n";
        }
        out << "  " << (outcome.passed() ? "PASS " : "FAIL ") << outcome.name << " (" << outcome.duration.count()
            << "ms)";
        if (!outcome.passed()) {
            out << " - " << outcome.message;
        }
        out << "\n";
    }

    if (!report.suiteFailures.empty()) {
        out << "\nSuite failures:\n";
        for (const auto &record : report.suiteFailures) {
            out << "  " << record.failure.group << ": " << record.failure.message << "\n";
        }
    }

    if (!report.serviceLogs.empty()) {
        out << "\nService errors:\n";
        for (const auto &entry : report.serviceLogs) {
            out << "  [" << entry.service << "] " << entry.message << "\n";
        }
    }
    return out.str();
}

std::string ReportWriter::renderErrors(const RunReport &report) {
    std::ostringstream out;
    writeHeader(out, report);

    const ErrorSource order[] = {ErrorSource::SDK, ErrorSource::SERVER, ErrorSource::NETWORK, ErrorSource::UNKNOWN};
    for (ErrorSource source : order) {
        std::vector<const TestOutcome *> failures;
        for (const auto &outcome : report.outcomes) {
            if (!outcome.passed() && outcome.classification.source == source) {
                failures.push_back(&outcome);
            }
        }
        if (failures.empty()) {
            continue;
        }
        out << "\n=== " << toString(source) << " errors (" << failures.size() << ") ===\n";
        for (const auto *outcome : failures) {
            writeFailure(out, *outcome);
        }
    }

    if (!report.suiteFailures.empty()) {
        out << "\n=== Suite failures (" << report.suiteFailures.size() << ") ===\n";
        for (const auto &record : report.suiteFailures) {
            out << "  [" << record.failure.group << "] " << record.failure.message << "\n";
        }
    }

    if (!report.serviceLogs.empty()) {
        out << "\n=== Service errors (" << report.serviceLogs.size() << ") ===\n";
        for (const auto &entry : report.serviceLogs) {
            out << "  [" << entry.service << "/" << entry.stream << "] " << entry.message << "\n";
        }
    }

    if (report.failed == 0 && report.suiteFailures.empty() && !report.crash && !report.setupError) {
        out << "\nNo failures.\n";
    }
    return out.str();
}

}  // namespace TOE

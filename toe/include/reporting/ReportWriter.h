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

#include "common/JsonUtils.h"
#include "reporting/TestOutcome.h"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace TOE {

/**
 * @brief Persists one run as a timestamped file set in the reports directory
 *
 * Files (ts = YYYY-MM-DDTHH-MM-SS-mmmZ):
 * - test-results-<ts>.json   structured report
 * - test-results-<ts>.txt    full narrative
 * - test-errors-<ts>.txt     failures only, grouped by classified source
 * - test-full-output-<ts>.txt captured transcript, when there is one
 *
 * Existing files are never overwritten: a taken stamp gets a numeric
 * suffix. Each file is written to a temporary name and renamed into place.
 *
 * Standalone artifacts for runs that end outside the normal report:
 * - build-error-<ts>.txt     failing preparation command and its output
 * - fatal-error-<ts>.txt     error that escaped the run
 */
class ReportWriter {
public:
    explicit ReportWriter(std::filesystem::path reportsDir, bool writeTranscript = true);

    /**
     * @brief Write the file set
     * @return Paths written; empty when the directory is unusable (logged, never thrown)
     */
    std::vector<std::string> write(const RunReport &report, const std::vector<std::string> &transcript) noexcept;

    /**
     * @return Path written, empty on failure (logged, never thrown)
     */
    std::string writeBuildError(const BuildFailure &failure) noexcept;

    /**
     * @return Path written, empty on failure (logged, never thrown)
     */
    std::string writeFatalError(const std::string &message, std::chrono::milliseconds duration) noexcept;

    const std::filesystem::path &reportsDir() const {
        return reportsDir_;
    }

    static std::string fileTimestamp(std::chrono::system_clock::time_point when);

    static json toJson(const RunReport &report);
    static std::string renderNarrative(const RunReport &report);
    static std::string renderErrors(const RunReport &report);
    static std::string renderBuildError(const BuildFailure &failure, const std::string &timestamp);
    static std::string renderFatalError(const std::string &message, std::chrono::milliseconds duration,
                                        const std::string &timestamp);

private:
    std::string uniqueStamp(const std::string &stamp) const;
    std::string writeArtifact(const std::string &prefix, const std::string &content) noexcept;
    static void writeAtomically(const std::filesystem::path &path, const std::string &content);

    std::filesystem::path reportsDir_;
    bool writeTranscript_;
};

}  // namespace TOE

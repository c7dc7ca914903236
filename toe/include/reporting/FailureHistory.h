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

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace TOE {

/**
 * @brief Reads the previous run's structured report back
 */
class FailureHistory {
public:
    explicit FailureHistory(std::filesystem::path reportsDir);

    /**
     * @brief Newest test-results-*.json in the reports directory
     */
    std::optional<std::filesystem::path> latestReport() const;

    /**
     * @brief Groups with a FAILED test or a suite failure in the latest report
     *
     * Empty when there is no readable report. Order of first appearance.
     */
    std::vector<std::string> failedGroups() const;

    static std::vector<std::string> failedGroupsIn(const std::filesystem::path &reportFile);

private:
    std::filesystem::path reportsDir_;
};

}  // namespace TOE

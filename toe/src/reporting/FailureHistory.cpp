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

#include "reporting/FailureHistory.h"
#include "common/JsonUtils.h"
#include "common/Logger.h"
#include "common/StringUtils.h"

#include <algorithm>
#include <system_error>

namespace TOE {

FailureHistory::FailureHistory(std::filesystem::path reportsDir) : reportsDir_(std::move(reportsDir)) {}

std::optional<std::filesystem::path> FailureHistory::latestReport() const {
    std::error_code ec;
    if (!std::filesystem::is_directory(reportsDir_, ec)) {
        return std::nullopt;
    }

    std::optional<std::filesystem::path> latest;
    std::filesystem::file_time_type latestTime;
    for (const auto &entry : std::filesystem::directory_iterator(reportsDir_, ec)) {
        const std::string name = entry.path().filename().string();
        if (!startsWith(name, "test-results-") || entry.path().extension() != ".json") {
            continue;
        }
        auto modified = entry.last_write_time(ec);
        if (ec) {
            continue;
        }
        // Equal mtimes: the lexically larger stamp is newer
        if (!latest || modified > latestTime || (modified == latestTime && entry.path() > *latest)) {
            latest = entry.path();
            latestTime = modified;
        }
    }
    return latest;
}

std::vector<std::string> FailureHistory::failedGroups() const {
    auto latest = latestReport();
    if (!latest) {
        LOG_INFO("FailureHistory: No previous results in {}", reportsDir_.string());
        return {};
    }
    return failedGroupsIn(*latest);
}

std::vector<std::string> FailureHistory::failedGroupsIn(const std::filesystem::path &reportFile) {
    std::vector<std::string> groups;
    std::string error;
    auto parsed = JsonUtils::parseFile(reportFile.string(), &error);
    if (!parsed) {
        LOG_WARN("FailureHistory: Cannot read {}: {}", reportFile.string(), error);
        return groups;
    }

    auto addGroup = [&groups](const std::string &group) {
        if (!group.empty() && std::find(groups.begin(), groups.end(), group) == groups.end()) {
            groups.push_back(group);
        }
    };

    if (parsed->contains("tests") && (*parsed)["tests"].is_array()) {
        for (const auto &test : (*parsed)["tests"]) {
            if (JsonUtils::getString(test, "status") == "FAILED") {
                addGroup(JsonUtils::getString(test, "group"));
            }
        }
    }
    if (parsed->contains("suiteFailures") && (*parsed)["suiteFailures"].is_array()) {
        for (const auto &failure : (*parsed)["suiteFailures"]) {
            addGroup(JsonUtils::getString(failure, "group"));
        }
    }
    return groups;
}

}  // namespace TOE

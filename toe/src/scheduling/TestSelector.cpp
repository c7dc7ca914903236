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

#include "scheduling/TestSelector.h"
#include "common/HarnessErrors.h"
#include "common/Logger.h"
#include "common/StringUtils.h"
#include "reporting/FailureHistory.h"

#include <algorithm>

namespace TOE {

TestSelector::TestSelector(const TestRegistry &registry, std::filesystem::path reportsDir)
    : registry_(registry), reportsDir_(std::move(reportsDir)) {}

void TestSelector::requireKnown(const std::vector<std::string> &names) const {
    std::vector<std::string> unknown;
    for (const auto &name : names) {
        if (!registry_.contains(name)) {
            unknown.push_back(name);
        }
    }
    if (!unknown.empty()) {
        throw ConfigurationException("Unknown test group(s): " + joinList(unknown) +
                                     ". Available: " + joinList(registry_.names()));
    }
}

std::optional<std::vector<std::string>> TestSelector::select(const SelectionOptions &options) const {
    requireKnown(options.only);
    requireKnown(options.skip);

    std::optional<std::vector<std::string>> selection;
    if (!options.only.empty()) {
        if (options.onlyFailing) {
            LOG_WARN("--only given, ignoring --only-failing");
        }
        selection = options.only;
    } else if (options.onlyFailing) {
        std::vector<std::string> failing;
        for (const auto &group : FailureHistory(reportsDir_).failedGroups()) {
            if (registry_.contains(group)) {
                failing.push_back(group);
            } else {
                LOG_WARN("Previously failing group '{}' is no longer registered", group);
            }
        }
        if (failing.empty()) {
            LOG_INFO("No failed groups in the previous run, running all groups");
        } else {
            LOG_INFO("Re-running previously failed groups: {}", joinList(failing));
            selection = failing;
        }
    }

    if (options.skip.empty()) {
        return selection;
    }

    std::vector<std::string> remaining = selection ? *selection : registry_.names();
    remaining.erase(std::remove_if(remaining.begin(), remaining.end(),
                                   [&options](const std::string &name) {
                                       return std::find(options.skip.begin(), options.skip.end(), name) !=
                                              options.skip.end();
                                   }),
                    remaining.end());
    if (remaining.empty()) {
        throw ConfigurationException("Every selected test group was skipped: " + joinList(options.skip));
    }
    LOG_INFO("Skipping test group(s): {}", joinList(options.skip));
    return remaining;
}

}  // namespace TOE

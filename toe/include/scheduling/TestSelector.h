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

#include "scheduling/TestRegistry.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace TOE {

struct SelectionOptions {
    std::vector<std::string> only;
    std::vector<std::string> skip;
    bool onlyFailing = false;
};

/**
 * @brief Turns command-line selection flags into the scheduler's selection
 *
 * --only takes precedence over --only-failing. --skip is applied last.
 * Dependencies of what remains are added later by the scheduler, so a
 * skipped group may still run when something selected needs it.
 */
class TestSelector {
public:
    TestSelector(const TestRegistry &registry, std::filesystem::path reportsDir);

    /**
     * @return nullopt to run every group
     * @throws ConfigurationException naming the available groups on an unknown name
     */
    std::optional<std::vector<std::string>> select(const SelectionOptions &options) const;

private:
    void requireKnown(const std::vector<std::string> &names) const;

    const TestRegistry &registry_;
    std::filesystem::path reportsDir_;
};

}  // namespace TOE

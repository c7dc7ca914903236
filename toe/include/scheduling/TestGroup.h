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

#include <functional>
#include <string>
#include <vector>

namespace TOE {

class TestSuiteContext;

/**
 * @brief One-time session setup a group needs before its first test
 */
struct InitRequirements {
    bool needsAuth = false;
    bool needsProject = false;
    bool needsCollection = false;

    InitRequirements &operator|=(const InitRequirements &other) {
        needsAuth = needsAuth || other.needsAuth;
        needsProject = needsProject || other.needsProject;
        needsCollection = needsCollection || other.needsCollection;
        return *this;
    }

    bool any() const {
        return needsAuth || needsProject || needsCollection;
    }
};

/**
 * @brief Named batch of related black-box tests
 *
 * The body runs its tests in declaration order through the context it is
 * given. declaredTests is the number of tests the body defines and feeds
 * the expected-total baseline.
 */
struct TestGroup {
    using Body = std::function<void(TestSuiteContext &)>;

    std::string name;
    std::string displayName;
    std::vector<std::string> dependencies;
    InitRequirements requirements;
    int declaredTests = 0;
    Body body;
};

}  // namespace TOE

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

#include "scheduling/TestGroup.h"

#include <map>
#include <string>
#include <vector>

namespace TOE {

/**
 * @brief Ordered collection of test groups, filled once at start-up
 *
 * Registration order is the tie-break for independent groups, so the run
 * order is reproducible.
 */
class TestRegistry {
public:
    /**
     * @throws ConfigurationException on an empty or duplicate name
     */
    void add(TestGroup group);

    bool contains(const std::string &name) const;

    /**
     * @throws ConfigurationException for an unknown name
     */
    const TestGroup &get(const std::string &name) const;

    const std::vector<TestGroup> &groups() const {
        return groups_;
    }

    std::vector<std::string> names() const;

    /**
     * @brief Dependency closure of selected, in execution order
     *
     * Dependencies come before their dependents; otherwise registration
     * order. Nothing outside the closure is returned.
     *
     * @throws ConfigurationException on unknown names (selected or declared
     *         as a dependency) and on dependency cycles
     */
    std::vector<std::string> resolveTestDependencies(const std::vector<std::string> &selected) const;

    /**
     * @brief Every group, in execution order
     */
    std::vector<std::string> resolveAll() const;

    /**
     * @brief Setup a single group needs
     *
     * A group that is "auth" or depends on it (transitively) needs an
     * authenticated session. A collection implies a project, and a project
     * implies authentication.
     */
    InitRequirements requirementsOf(const std::string &name) const;

    InitRequirements initializationRequirements(const std::vector<std::string> &groups) const;

    /**
     * @brief Tests declared across the whole registry
     */
    int expectedTestCount() const;

private:
    enum class Mark { None, Visiting, Done };

    void visit(const std::string &name, std::map<std::string, Mark> &marks, std::vector<std::string> &path,
               std::vector<std::string> &closure) const;
    bool dependsOn(const std::string &name, const std::string &target) const;

    std::vector<TestGroup> groups_;
    std::map<std::string, size_t> index_;
};

}  // namespace TOE

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

#include "scheduling/TestRegistry.h"
#include "common/HarnessErrors.h"
#include "common/StringUtils.h"

#include <algorithm>
#include <set>

namespace TOE {

void TestRegistry::add(TestGroup group) {
    if (group.name.empty()) {
        throw ConfigurationException("Test group name must not be empty");
    }
    if (contains(group.name)) {
        throw ConfigurationException("Test group '" + group.name + "' registered twice");
    }
    if (group.displayName.empty()) {
        group.displayName = group.name;
    }
    index_[group.name] = groups_.size();
    groups_.push_back(std::move(group));
}

bool TestRegistry::contains(const std::string &name) const {
    return index_.find(name) != index_.end();
}

const TestGroup &TestRegistry::get(const std::string &name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        throw ConfigurationException("Unknown test group '" + name + "'. Available: " + joinList(names()));
    }
    return groups_[it->second];
}

std::vector<std::string> TestRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(groups_.size());
    for (const auto &group : groups_) {
        result.push_back(group.name);
    }
    return result;
}

void TestRegistry::visit(const std::string &name, std::map<std::string, Mark> &marks, std::vector<std::string> &path,
                         std::vector<std::string> &closure) const {
    Mark &mark = marks[name];
    if (mark == Mark::Done) {
        return;
    }
    if (mark == Mark::Visiting) {
        path.push_back(name);
        throw ConfigurationException("Dependency cycle between test groups: " + joinList(path, " -> "));
    }

    const TestGroup &group = get(name);
    mark = Mark::Visiting;
    path.push_back(name);
    for (const auto &dependency : group.dependencies) {
        if (!contains(dependency)) {
            throw ConfigurationException("Test group '" + name + "' depends on unknown group '" + dependency + "'");
        }
        visit(dependency, marks, path, closure);
    }
    path.pop_back();
    marks[name] = Mark::Done;
    closure.push_back(name);
}

std::vector<std::string> TestRegistry::resolveTestDependencies(const std::vector<std::string> &selected) const {
    for (const auto &name : selected) {
        get(name);
    }

    // Membership of the closure
    std::map<std::string, Mark> marks;
    std::vector<std::string> closure;
    for (const auto &name : selected) {
        std::vector<std::string> path;
        visit(name, marks, path, closure);
    }
    std::set<std::string> members(closure.begin(), closure.end());

    // Execution order: registration order, each group preceded by its dependencies
    std::map<std::string, Mark> orderMarks;
    std::vector<std::string> ordered;
    for (const auto &group : groups_) {
        if (members.count(group.name)) {
            std::vector<std::string> path;
            visit(group.name, orderMarks, path, ordered);
        }
    }
    return ordered;
}

std::vector<std::string> TestRegistry::resolveAll() const {
    return resolveTestDependencies(names());
}

bool TestRegistry::dependsOn(const std::string &name, const std::string &target) const {
    std::vector<std::string> pending = get(name).dependencies;
    std::set<std::string> seen;
    while (!pending.empty()) {
        std::string current = pending.back();
        pending.pop_back();
        if (current == target) {
            return true;
        }
        if (!seen.insert(current).second || !contains(current)) {
            continue;
        }
        const auto &dependencies = get(current).dependencies;
        pending.insert(pending.end(), dependencies.begin(), dependencies.end());
    }
    return false;
}

InitRequirements TestRegistry::requirementsOf(const std::string &name) const {
    InitRequirements requirements = get(name).requirements;
    if (name == "auth" || dependsOn(name, "auth")) {
        requirements.needsAuth = true;
    }
    if (requirements.needsCollection) {
        requirements.needsProject = true;
    }
    if (requirements.needsProject) {
        requirements.needsAuth = true;
    }
    return requirements;
}

InitRequirements TestRegistry::initializationRequirements(const std::vector<std::string> &groups) const {
    InitRequirements combined;
    for (const auto &name : groups) {
        combined |= requirementsOf(name);
    }
    return combined;
}

int TestRegistry::expectedTestCount() const {
    int count = 0;
    for (const auto &group : groups_) {
        count += group.declaredTests;
    }
    return count;
}

}  // namespace TOE

// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-TOE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "common/RunContext.h"
#include <algorithm>

namespace TOE {

RunContext::RunContext(RunOptions options) : options_(options), startedAt_(std::chrono::steady_clock::now()) {}

void RunContext::requestStop() noexcept {
    stopRequested_.store(true);
}

bool RunContext::stopRequested() const noexcept {
    return stopRequested_.load();
}

void RunContext::beginGroup(const std::string &group) {
    std::lock_guard<std::mutex> lock(mutex_);
    currentGroup_ = group;
}

void RunContext::endGroup() {
    std::lock_guard<std::mutex> lock(mutex_);
    currentGroup_.clear();
}

std::string RunContext::currentGroup() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentGroup_;
}

int RunContext::noteTestAttempted() {
    return ++testsAttempted_;
}

int RunContext::testsAttempted() const {
    return testsAttempted_.load();
}

void RunContext::rememberCreatedProject(const std::string &projectId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(createdProjects_.begin(), createdProjects_.end(), projectId) == createdProjects_.end()) {
        createdProjects_.push_back(projectId);
    }
}

std::vector<std::string> RunContext::createdProjects() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return createdProjects_;
}

std::chrono::milliseconds RunContext::elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startedAt_);
}

}  // namespace TOE

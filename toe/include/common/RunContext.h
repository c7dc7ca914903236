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

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

namespace TOE {

/**
 * @brief Run-wide switches read by the scheduler and the console reporter
 */
struct RunOptions {
    bool stopOnFirstFailure = false;
    bool verbose = false;
    bool hidePassed = false;
};

/**
 * @brief Authenticated session against the system under test
 *
 * Filled by SessionSetup, or supplied by a caller that already holds a
 * session; fields already set are never recreated.
 */
struct SessionState {
    std::string baseUrl;
    bool connected = false;
    std::string sessionToken;
    std::string projectId;
    std::string projectName;
    std::string collectionName;
    std::string collectionId;

    bool hasToken() const {
        return !sessionToken.empty();
    }

    bool hasProject() const {
        return !projectId.empty();
    }

    bool hasCollection() const {
        return !collectionName.empty();
    }
};

/**
 * @brief Explicit state of one harness run
 *
 * Passed by reference to every component that needs run state. Nothing in
 * the harness keeps module-level run counters.
 *
 * requestStop() only touches an atomic flag and is safe to call from a
 * signal handler.
 */
class RunContext {
public:
    explicit RunContext(RunOptions options = {});

    const RunOptions &options() const {
        return options_;
    }

    RunOptions &options() {
        return options_;
    }

    SessionState &session() {
        return session_;
    }

    const SessionState &session() const {
        return session_;
    }

    void requestStop() noexcept;
    bool stopRequested() const noexcept;

    void beginGroup(const std::string &group);
    void endGroup();
    std::string currentGroup() const;

    /**
     * @brief Count a test as attempted
     * @return Number of tests attempted so far, this one included
     */
    int noteTestAttempted();
    int testsAttempted() const;

    /**
     * @brief Remember a project created on behalf of the run for teardown
     */
    void rememberCreatedProject(const std::string &projectId);
    std::vector<std::string> createdProjects() const;

    std::chrono::steady_clock::time_point startedAt() const {
        return startedAt_;
    }

    std::chrono::milliseconds elapsed() const;

private:
    RunOptions options_;
    SessionState session_;
    std::atomic<bool> stopRequested_{false};
    std::atomic<int> testsAttempted_{0};
    mutable std::mutex mutex_;
    std::string currentGroup_;
    std::vector<std::string> createdProjects_;
    std::chrono::steady_clock::time_point startedAt_;
};

}  // namespace TOE

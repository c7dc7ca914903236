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

#include "common/HarnessErrors.h"
#include "common/RetryPolicy.h"
#include "resources/CleanupTarget.h"

#include <filesystem>
#include <string>
#include <vector>

namespace TOE {

/**
 * @brief What one reconciliation pass did
 */
struct ReconcileReport {
    std::vector<std::string> removed;        // paths that existed and were deleted
    std::vector<CleanupWarning> warnings;    // paths that survived every retry
    std::vector<std::string> leftovers;      // database files still present at verification
    int targetsVisited = 0;

    bool clean() const {
        return warnings.empty() && leftovers.empty();
    }
};

/**
 * @brief Brings on-disk state back to a known-empty baseline
 *
 * Every path is deleted under a retry policy (files and directories have
 * separate budgets); files are probed for lock-freedom before a retry.
 * Deletion failures become CleanupWarnings and never abort the pass. After
 * all targets, sweep directories are re-listed and anything that appeared
 * or survived is retried once more, then verification directories are
 * scanned for database files.
 *
 * Only failing to create a required directory throws.
 */
class ResourceReconciler {
public:
    struct Options {
        RetryPolicy filePolicy = RetryPolicy::forFileDeletion();
        RetryPolicy directoryPolicy = RetryPolicy::forDirectoryDeletion();
        RetrySleeper sleeper;
        std::vector<std::filesystem::path> sweepDirectories;
        std::vector<std::filesystem::path> verifyDirectories;
        std::vector<std::filesystem::path> requiredDirectories;
    };

    ResourceReconciler();
    explicit ResourceReconciler(Options options);

    /**
     * @throws SetupException if a required directory cannot be created
     */
    ReconcileReport reconcile(const std::vector<CleanupTarget> &targets);

    const Options &options() const {
        return options_;
    }

    /**
     * @brief Open for read-write and close again; false while another process holds a lock
     */
    static bool isLockFree(const std::filesystem::path &path);

    /**
     * @brief Matches *.db, *.db-wal and *.db-shm
     */
    static bool matchesDatabasePattern(const std::string &fileName);

    /**
     * @brief Main databases, every project database and the backup repository under dataDir
     */
    static std::vector<CleanupTarget> defaultTargets(const std::filesystem::path &dataDir);

    /**
     * @brief Options wired for defaultTargets(dataDir)
     *
     * dataDir and dataDir/projects are required: they exist after every pass.
     */
    static Options defaultOptions(const std::filesystem::path &dataDir);

private:
    void removeTarget(const CleanupTarget &target, ReconcileReport &report);
    bool removePath(const std::filesystem::path &path, CleanupKind kind, ReconcileReport &report);
    void verify(ReconcileReport &report);

    Options options_;
};

/**
 * @brief Consecutive unclean reconciliations, persisted across runs
 *
 * Backed by a one-number file so the streak survives between harness
 * invocations.
 */
class CleanupWarningStreak {
public:
    explicit CleanupWarningStreak(std::filesystem::path stateFile);

    int current() const;

    /**
     * @brief Reset on a clean pass, increment otherwise
     * @return Streak after recording
     */
    int record(bool clean);

private:
    std::filesystem::path stateFile_;
};

}  // namespace TOE

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

#include "resources/ResourceReconciler.h"
#include "common/Logger.h"

#include <fstream>
#include <regex>
#include <system_error>

namespace TOE {

namespace {

const char *const MAIN_DATABASES[] = {"krapi_main.db", "krapi.db"};

}  // namespace

ResourceReconciler::ResourceReconciler() : ResourceReconciler(Options()) {}

ResourceReconciler::ResourceReconciler(Options options) : options_(std::move(options)) {}

bool ResourceReconciler::isLockFree(const std::filesystem::path &path) {
    std::fstream probe(path, std::ios::in | std::ios::out | std::ios::binary);
    if (!probe.is_open()) {
        return false;
    }
    probe.close();
    return true;
}

bool ResourceReconciler::matchesDatabasePattern(const std::string &fileName) {
    static const std::regex pattern(R"(\.db(-wal|-shm)?$)");
    return std::regex_search(fileName, pattern);
}

std::vector<CleanupTarget> ResourceReconciler::defaultTargets(const std::filesystem::path &dataDir) {
    std::vector<CleanupTarget> targets;
    for (const char *name : MAIN_DATABASES) {
        targets.push_back(CleanupTarget::database(dataDir / name));
    }
    for (auto &entry : CleanupTarget::entriesOf(dataDir / "projects")) {
        targets.push_back(std::move(entry));
    }
    targets.push_back(CleanupTarget::directory(dataDir / "backups" / "restic-repo"));
    return targets;
}

ResourceReconciler::Options ResourceReconciler::defaultOptions(const std::filesystem::path &dataDir) {
    Options options;
    options.sweepDirectories = {dataDir / "projects"};
    options.verifyDirectories = {dataDir, dataDir / "projects"};
    options.requiredDirectories = {dataDir, dataDir / "projects"};
    return options;
}

ReconcileReport ResourceReconciler::reconcile(const std::vector<CleanupTarget> &targets) {
    ReconcileReport report;
    LOG_INFO("Reconciling {} cleanup target(s)...", targets.size());

    for (const auto &target : targets) {
        removeTarget(target, report);
    }

    // Second pass: anything still (or newly) present in a sweep directory
    for (const auto &dir : options_.sweepDirectories) {
        for (const auto &target : CleanupTarget::entriesOf(dir)) {
            bool alreadyWarned = false;
            for (const auto &warning : report.warnings) {
                if (warning.path == target.path.string()) {
                    alreadyWarned = true;
                    break;
                }
            }
            if (!alreadyWarned) {
                removeTarget(target, report);
            }
        }
    }

    for (const auto &dir : options_.requiredDirectories) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec && !std::filesystem::is_directory(dir)) {
            throw SetupException(SetupError{"Cannot create directory " + dir.string() + ": " + ec.message(), {}});
        }
    }

    verify(report);

    if (report.removed.empty()) {
        LOG_INFO("No leftover resources found");
    } else {
        LOG_INFO("Removed {} leftover path(s)", report.removed.size());
    }
    return report;
}

void ResourceReconciler::removeTarget(const CleanupTarget &target, ReconcileReport &report) {
    report.targetsVisited++;
    for (const auto &path : target.expand()) {
        removePath(path, target.kind, report);
    }
}

bool ResourceReconciler::removePath(const std::filesystem::path &path, CleanupKind kind, ReconcileReport &report) {
    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::symlink_status(path, ec))) {
        return true;
    }

    const bool isDirectory = kind == CleanupKind::Directory;
    const RetryPolicy &policy = isDirectory ? options_.directoryPolicy : options_.filePolicy;
    std::function<bool()> probe;
    if (!isDirectory) {
        probe = [path]() {
            std::error_code existsEc;
            return !std::filesystem::exists(path, existsEc) || isLockFree(path);
        };
    }

    auto outcome = Retry::run(
        policy,
        [&path, isDirectory](std::string &error) {
            std::error_code removeEc;
            if (isDirectory) {
                std::filesystem::remove_all(path, removeEc);
            } else {
                std::filesystem::remove(path, removeEc);
            }
            if (removeEc) {
                error = removeEc.message();
                return false;
            }
            return true;
        },
        probe, options_.sleeper);

    if (outcome.succeeded) {
        LOG_DEBUG("Deleted {} {}", toString(kind), path.string());
        report.removed.push_back(path.string());
        return true;
    }

    LOG_WARN("Could not delete {} after {} attempts: {}", path.string(), outcome.attempts, outcome.lastError);
    report.warnings.push_back(CleanupWarning{path.string(), outcome.lastError, outcome.attempts});
    return false;
}

void ResourceReconciler::verify(ReconcileReport &report) {
    for (const auto &dir : options_.verifyDirectories) {
        std::error_code ec;
        if (!std::filesystem::is_directory(dir, ec)) {
            continue;
        }
        for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            std::error_code typeEc;
            if (!it->is_regular_file(typeEc)) {
                continue;
            }
            const std::string name = it->path().filename().string();
            if (matchesDatabasePattern(name)) {
                report.leftovers.push_back(it->path().string());
            }
        }
    }

    if (!report.leftovers.empty()) {
        LOG_WARN("Verification found {} database file(s) still present; the next run will retry",
                 report.leftovers.size());
        for (const auto &leftover : report.leftovers) {
            LOG_WARN("   leftover: {}", leftover);
        }
    }
}

CleanupWarningStreak::CleanupWarningStreak(std::filesystem::path stateFile) : stateFile_(std::move(stateFile)) {}

int CleanupWarningStreak::current() const {
    std::ifstream in(stateFile_);
    int value = 0;
    if (in >> value && value > 0) {
        return value;
    }
    return 0;
}

int CleanupWarningStreak::record(bool clean) {
    int streak = clean ? 0 : current() + 1;

    std::error_code ec;
    if (stateFile_.has_parent_path()) {
        std::filesystem::create_directories(stateFile_.parent_path(), ec);
    }
    std::ofstream out(stateFile_, std::ios::trunc);
    if (!out) {
        LOG_WARN("Could not persist cleanup warning streak to {}", stateFile_.string());
        return streak;
    }
    out << streak << "\n";
    return streak;
}

}  // namespace TOE

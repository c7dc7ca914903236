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

#include "common/RetryPolicy.h"
#include "common/RunContext.h"
#include "http/IHttpClient.h"
#include "process/ICommandRunner.h"
#include "process/ProcessSupervisor.h"
#include "reporting/TestOutcome.h"
#include "runner/HarnessConfig.h"
#include "scheduling/TestRegistry.h"

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace TOE {

/**
 * @brief Composition root of one harness invocation
 *
 * Reconcile -> build and configure -> start services -> run groups ->
 * finalize report -> stop services -> reconcile. Teardown runs whatever
 * happened before it. Reconciliation, preparation and service management
 * are skipped when the system under test is managed externally
 * (manageServices == false).
 *
 * An exception that escapes teardown leaves a fatal-error log in the
 * reports directory before it propagates.
 */
class Runner {
public:
    Runner(HarnessConfig config, std::shared_ptr<IHttpClient> http, std::shared_ptr<ICommandRunner> commands);

    TestRegistry &registry() {
        return registry_;
    }

    const HarnessConfig &config() const {
        return config_;
    }

    /**
     * @brief Backoff sleeper for reconciliation (tests pass a no-op)
     */
    void setSleeper(RetrySleeper sleeper) {
        sleeper_ = std::move(sleeper);
    }

    void setReadinessPolicy(const ReadinessPolicy &policy) {
        readiness_ = policy;
    }

    /**
     * @brief Execute the whole run
     * @return Process exit code: 0 only for a fully successful run
     * @throws ConfigurationException before anything is touched when the selection is invalid
     */
    int run();

    /**
     * @brief True while run() is executing
     */
    bool running() const {
        return activeContext_.load() != nullptr;
    }

    /**
     * @brief Ask an active run to stop before its next test; async-signal-safe
     */
    void requestStop() noexcept;

    /**
     * @brief Report of the last run(), if one finished
     */
    const std::optional<RunReport> &lastReport() const {
        return lastReport_;
    }

    std::vector<ServiceSpec> serviceSpecs() const;

private:
    int execute(const std::optional<std::vector<std::string>> &selection);
    void reconcile(const std::string &phase, bool enforceStreak);
    void prepare();
    void cleanupCreatedProjects(RunContext &context, ProcessSupervisor &supervisor);

    HarnessConfig config_;
    std::shared_ptr<IHttpClient> http_;
    std::shared_ptr<ICommandRunner> commands_;
    TestRegistry registry_;
    RetrySleeper sleeper_;
    ReadinessPolicy readiness_;
    std::atomic<RunContext *> activeContext_{nullptr};
    std::optional<RunReport> lastReport_;
};

}  // namespace TOE

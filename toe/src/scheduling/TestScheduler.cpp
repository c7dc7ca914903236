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

#include "scheduling/TestScheduler.h"
#include "common/HarnessErrors.h"
#include "common/Logger.h"
#include "common/StringUtils.h"
#include "reporting/ResultAggregator.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <set>

namespace TOE {

TestScheduler::TestScheduler(const TestRegistry &registry, RunContext &run, ResultAggregator &aggregator)
    : registry_(registry), run_(run), aggregator_(aggregator) {}

void TestScheduler::setSessionSetup(SessionSetupHook hook) {
    sessionSetup_ = std::move(hook);
}

void TestScheduler::setBeforeEachTest(TestHook hook) {
    beforeEachTest_ = std::move(hook);
}

std::vector<std::string> TestScheduler::plan(const std::optional<std::vector<std::string>> &selected) const {
    return selected ? registry_.resolveTestDependencies(*selected) : registry_.resolveAll();
}

RunSummary TestScheduler::run(const std::optional<std::vector<std::string>> &selected) {
    RunSummary summary;
    const auto order = plan(selected);

    std::set<std::string> explicitGroups;
    if (selected) {
        explicitGroups.insert(selected->begin(), selected->end());
        std::vector<std::string> added;
        for (const auto &name : order) {
            if (!explicitGroups.count(name)) {
                added.push_back(name);
            }
        }
        if (!added.empty()) {
            LOG_INFO("Added required dependencies: {}", joinList(added));
        }
    }

    const InitRequirements requirements = registry_.initializationRequirements(order);
    if (sessionSetup_) {
        LOG_DEBUG("Session setup: auth={} project={} collection={}", requirements.needsAuth, requirements.needsProject,
                  requirements.needsCollection);
        sessionSetup_(requirements);
    }

    LOG_INFO("Running {} test group(s): {}", order.size(), joinList(order));

    bool stop = false;
    for (size_t i = 0; i < order.size(); ++i) {
        const std::string &name = order[i];
        if (!stop && run_.stopRequested()) {
            summary.interrupted = true;
            summary.stopReason = "Stop requested";
            stop = true;
        }
        if (stop) {
            summary.skippedGroups.assign(order.begin() + static_cast<std::ptrdiff_t>(i), order.end());
            break;
        }

        const TestGroup &group = registry_.get(name);
        const bool silent = selected.has_value() && !explicitGroups.count(name);
        run_.beginGroup(name);
        aggregator_.beginGroup(name, group.displayName, silent);

        TestSuiteContext context(group, run_, aggregator_, beforeEachTest_);
        auto started = std::chrono::steady_clock::now();
        std::exception_ptr fatal;

        try {
            if (group.body) {
                group.body(context);
            }
        } catch (const StopRequested &e) {
            if (run_.stopRequested()) {
                summary.interrupted = true;
            } else {
                summary.stoppedEarly = true;
            }
            summary.stopReason = e.what();
            stop = true;
        } catch (const SetupException &) {
            fatal = std::current_exception();
        } catch (const ProcessCrashException &) {
            fatal = std::current_exception();
        } catch (const std::exception &e) {
            LOG_ERROR("Test group '{}' failed outside of a test: {}", name, e.what());
            aggregator_.recordSuiteFailure(SuiteFailure{name, e.what()});
            summary.suiteFailures++;
            if (run_.options().stopOnFirstFailure) {
                summary.stoppedEarly = true;
                summary.stopReason = std::string("Suite failure in ") + name + ": " + e.what();
                stop = true;
            }
        }

        aggregator_.recordGroupDuration(
            name, std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started));
        run_.endGroup();
        summary.executedGroups.push_back(name);
        summary.passed += context.passed();
        summary.failed += context.failed();

        if (fatal) {
            std::rethrow_exception(fatal);
        }
    }

    summary.total = summary.passed + summary.failed;
    if (summary.stoppedEarly) {
        aggregator_.markStoppedEarly();
        LOG_WARN("{}", summary.stopReason);
    }
    if (summary.interrupted) {
        aggregator_.markInterrupted();
        LOG_WARN("Run interrupted, {} group(s) skipped", summary.skippedGroups.size());
    }
    return summary;
}

}  // namespace TOE

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

#include "runner/Runner.h"
#include "api/ApiClient.h"
#include "api/SessionSetup.h"
#include "common/HarnessErrors.h"
#include "common/Logger.h"
#include "common/StringUtils.h"
#include "process/PortReaper.h"
#include "reporting/ConsoleTestReporter.h"
#include "reporting/ReportWriter.h"
#include "reporting/ResultAggregator.h"
#include "resources/ResourceReconciler.h"
#include "runner/AppConfigurator.h"
#include "runner/ServiceBuilder.h"
#include "scheduling/TestScheduler.h"
#include "scheduling/TestSelector.h"

#include <chrono>
#include <stdexcept>

namespace TOE {

namespace {

constexpr auto BACKEND_GRACE = std::chrono::milliseconds(5000);
constexpr auto FRONTEND_GRACE = std::chrono::milliseconds(3000);

/**
 * @brief Publishes the run's context to requestStop() for the guard's lifetime
 */
class ActiveContextGuard {
public:
    ActiveContextGuard(std::atomic<RunContext *> &slot, RunContext &context) : slot_(slot) {
        slot_.store(&context);
    }

    ~ActiveContextGuard() noexcept {
        slot_.store(nullptr);
    }

    ActiveContextGuard(const ActiveContextGuard &) = delete;
    ActiveContextGuard &operator=(const ActiveContextGuard &) = delete;

private:
    std::atomic<RunContext *> &slot_;
};

}  // namespace

Runner::Runner(HarnessConfig config, std::shared_ptr<IHttpClient> http, std::shared_ptr<ICommandRunner> commands)
    : config_(std::move(config)), http_(std::move(http)), commands_(std::move(commands)) {
    if (!http_) {
        throw std::invalid_argument("Runner requires an HTTP client");
    }
    if (!commands_) {
        throw std::invalid_argument("Runner requires a command runner");
    }
}

void Runner::requestStop() noexcept {
    RunContext *context = activeContext_.load();
    if (context != nullptr) {
        context->requestStop();
    }
}

std::vector<ServiceSpec> Runner::serviceSpecs() const {
    ServiceSpec backend;
    backend.name = "backend";
    backend.command = config_.backendCommand;
    backend.workingDirectory = config_.projectRoot.string();
    backend.healthUrl = config_.backendHealthUrl;
    backend.port = config_.backendPort();
    backend.gracePeriod = BACKEND_GRACE;

    ServiceSpec frontend;
    frontend.name = "frontend";
    frontend.command = config_.frontendCommand;
    frontend.workingDirectory = config_.projectRoot.string();
    frontend.healthUrl = config_.frontendHealthUrl;
    frontend.port = config_.frontendPort();
    frontend.gracePeriod = FRONTEND_GRACE;

    return {backend, frontend};
}

void Runner::reconcile(const std::string &phase, bool enforceStreak) {
    auto options = ResourceReconciler::defaultOptions(config_.dataDir);
    options.sleeper = sleeper_;
    ResourceReconciler reconciler(options);

    LOG_INFO("Reconciling {} ({})", config_.dataDir.string(), phase);
    auto report = reconciler.reconcile(ResourceReconciler::defaultTargets(config_.dataDir));
    LOG_INFO("Reconcile {}: removed {}, warnings {}, leftovers {}", phase, report.removed.size(),
             report.warnings.size(), report.leftovers.size());

    if (!enforceStreak) {
        return;
    }
    CleanupWarningStreak streak(config_.reportsDir / ".cleanup-warnings");
    int count = streak.record(report.clean());
    if (config_.maxCleanupWarnings > 0 && count > config_.maxCleanupWarnings) {
        SetupError error;
        error.message = "Cleanup left files behind on " + std::to_string(count) +
                        " consecutive runs (limit " + std::to_string(config_.maxCleanupWarnings) + ")";
        throw SetupException(error);
    }
}

void Runner::prepare() {
    if (!config_.buildSteps.empty()) {
        ServiceBuilder builder(commands_, config_.projectRoot);
        try {
            builder.build(config_.buildSteps);
        } catch (const BuildException &e) {
            ReportWriter(config_.reportsDir).writeBuildError(e.failure());
            throw;
        }
    }

    if (config_.configureApp) {
        AppConfigurator configurator(config_.projectRoot);
        configurator.configure(AppConfigurator::defaultSettings(config_.baseUrl, config_.backendHealthUrl));
    }
}

void Runner::cleanupCreatedProjects(RunContext &context, ProcessSupervisor &supervisor) {
    auto projects = context.createdProjects();
    if (projects.empty() || !context.session().hasToken()) {
        return;
    }
    if (config_.manageServices) {
        ServiceProcess *frontend = supervisor.find("frontend");
        if (frontend == nullptr || !frontend->isAlive() || supervisor.crashed()) {
            LOG_WARN("Skipping API cleanup of {} test project(s): frontend is not running", projects.size());
            return;
        }
    }

    ApiClient api(http_, context.session());
    for (const auto &id : projects) {
        try {
            api.del("/api/krapi/k1/projects/" + id);
            LOG_INFO("Deleted test project {}", id);
        } catch (const ApiException &e) {
            LOG_WARN("Could not delete test project {}: {}", id, e.what());
        }
    }
}

int Runner::run() {
    // Configuration problems surface before any state is touched
    const auto selection = TestSelector(registry_, config_.reportsDir).select(config_.selection);

    const auto started = std::chrono::steady_clock::now();
    try {
        return execute(selection);
    } catch (const std::exception &e) {
        auto elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
        LOG_CRITICAL("Run died: {}", e.what());
        ReportWriter(config_.reportsDir).writeFatalError(e.what(), elapsed);
        throw;
    }
}

int Runner::execute(const std::optional<std::vector<std::string>> &selection) {
    RunContext context(RunOptions{config_.stopOnFirstFailure, config_.verbose, config_.hidePassed});
    context.session().baseUrl = config_.baseUrl;

    const int expectedTotal =
        config_.expectedTotalTests > 0 ? config_.expectedTotalTests : registry_.expectedTestCount();
    ResultAggregator aggregator(expectedTotal,
                                std::make_unique<ReportWriter>(config_.reportsDir, config_.writeTranscript));
    aggregator.addReporter(std::make_shared<ConsoleTestReporter>(context.options()));
    aggregator.setEnvironment(config_.describe());

    TestScheduler scheduler(registry_, context, aggregator);
    LOG_DEBUG("Planned groups: {}", joinList(scheduler.plan(selection)));

    ProcessSupervisor supervisor(http_, std::make_shared<PortReaper>(commands_, sleeper_));
    supervisor.setVerbose(config_.verbose);
    supervisor.setOutputSink([&aggregator](const std::string &service, const OutputLine &line, bool important) {
        aggregator.captureOutput(service, line, important);
    });

    ActiveContextGuard activeGuard(activeContext_, context);
    LOG_INFO("Starting run: {} test(s) expected", expectedTotal);

    try {
        if (config_.manageServices) {
            reconcile("pre-run", true);
            prepare();
            supervisor.startAll(serviceSpecs(), readiness_);
        }

        auto setup = std::make_shared<SessionSetup>(http_, context, config_.frontendHealthUrl, config_.credentials);
        scheduler.setSessionSetup([setup](const InitRequirements &requirements) { setup->prepare(requirements); });
        scheduler.setBeforeEachTest([&supervisor] { supervisor.throwIfCrashed(); });

        auto summary = scheduler.run(selection);
        LOG_INFO("Scheduler finished: {} passed, {} failed, {} suite failure(s)", summary.passed, summary.failed,
                 summary.suiteFailures);
    } catch (const SetupException &e) {
        LOG_ERROR("Setup failed: {}", e.what());
        aggregator.recordSetupError(e.error());
    } catch (const ProcessCrashException &e) {
        LOG_ERROR("Aborting run: {}", e.what());
        aggregator.recordCrash(e.crash());
    } catch (const std::exception &e) {
        LOG_ERROR("Run aborted: {}", e.what());
        aggregator.recordSuiteFailure(SuiteFailure{"runner", e.what()});
    }

    // Teardown: runs regardless of how the run ended
    if (auto crash = supervisor.crash()) {
        aggregator.recordCrash(*crash);
    }
    if (context.stopRequested()) {
        aggregator.markInterrupted();
    }
    aggregator.setTestProject(context.session().projectId, context.session().collectionName);

    if (config_.cleanupAfterRun) {
        cleanupCreatedProjects(context, supervisor);
    }

    const RunReport &report = aggregator.finalize();
    lastReport_ = report;

    if (config_.manageServices) {
        supervisor.stopAll();
        try {
            reconcile("post-run", false);
        } catch (const SetupException &e) {
            LOG_WARN("Post-run reconciliation failed: {}", e.what());
        }
    }

    return report.success() ? 0 : 1;
}

}  // namespace TOE

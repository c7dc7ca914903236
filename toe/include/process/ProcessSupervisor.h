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
#include "http/IHttpClient.h"
#include "process/CrashDetector.h"
#include "process/PortReaper.h"
#include "process/ServiceProcess.h"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace TOE {

/**
 * @brief Health polling budget (defaults: 60 attempts, 2s apart)
 */
struct ReadinessPolicy {
    int maxAttempts = 60;
    std::chrono::milliseconds interval{2000};
    std::chrono::milliseconds requestTimeout{5000};
};

struct ReadinessResult {
    bool ready = false;
    int attempts = 0;
    std::vector<ServiceDiagnostic> diagnostics;
};

/**
 * @brief Starts, health-checks and stops the services under test
 *
 * Readiness is decided only by polling each service's health URL. Output is
 * scanned for fatal signatures on each process's reader loop; the first
 * match (or a non-zero exit while running) kills every supervised process
 * and is surfaced to the control thread through throwIfCrashed().
 *
 * Shutdown: SIGTERM, wait the grace period, SIGKILL only if still alive.
 * A process that already exited receives no signal.
 */
class ProcessSupervisor {
public:
    using OutputSink = std::function<void(const std::string &service, const OutputLine &line, bool important)>;
    using CrashCallback = std::function<void(const ProcessCrash &crash)>;

    /**
     * @param httpClient Client used for health polling (required)
     * @param portReaper Optional reaper for ServiceSpec::port
     * @throws std::invalid_argument if httpClient is null
     */
    explicit ProcessSupervisor(std::shared_ptr<IHttpClient> httpClient, std::shared_ptr<PortReaper> portReaper = nullptr,
                               CrashDetector detector = CrashDetector());
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor &) = delete;
    ProcessSupervisor &operator=(const ProcessSupervisor &) = delete;

    void setVerbose(bool verbose) {
        verbose_ = verbose;
    }

    /**
     * @brief Receives every output line (transcript, service error log); called on reader threads
     */
    void setOutputSink(OutputSink sink);

    /**
     * @brief Notified once, on the reader thread, when the first crash is detected
     */
    void setCrashCallback(CrashCallback callback);

    ServiceProcess &start(const ServiceSpec &spec);

    /**
     * @brief Poll every started service with a health URL until all answer 2xx
     * @throws ProcessCrashException if a service crashes while waiting
     */
    ReadinessResult awaitReady(const ReadinessPolicy &policy = ReadinessPolicy());

    /**
     * @brief Start every spec in order, then wait for readiness
     * @throws SetupException with per-service diagnostics when the budget is exhausted
     * @throws ProcessCrashException if a service crashes during startup
     */
    void startAll(const std::vector<ServiceSpec> &specs, const ReadinessPolicy &policy = ReadinessPolicy());

    void stop(ServiceProcess &process, std::chrono::milliseconds gracePeriod);

    /**
     * @brief Stop every process, most recently started first
     */
    void stopAll();

    bool crashed() const;
    std::optional<ProcessCrash> crash() const;

    /**
     * @throws ProcessCrashException if any supervised process crashed
     */
    void throwIfCrashed() const;

    std::vector<ServiceDiagnostic> diagnostics();

    ServiceProcess *find(const std::string &name);

    size_t processCount() const;

private:
    void handleLine(ServiceProcess &process, const OutputLine &line);
    void handleClosed(ServiceProcess &process);
    void recordCrash(ServiceProcess &process, ProcessCrash crash);
    void terminateAll(const ServiceProcess &origin);
    ServiceDiagnostic probe(ServiceProcess &process, std::chrono::milliseconds timeout);
    std::vector<ServiceProcess *> snapshot() const;

    std::shared_ptr<IHttpClient> httpClient_;
    std::shared_ptr<PortReaper> portReaper_;
    CrashDetector detector_;
    bool verbose_ = false;

    mutable std::mutex processesMutex_;
    std::vector<std::unique_ptr<ServiceProcess>> processes_;

    mutable std::mutex callbackMutex_;
    OutputSink sink_;
    CrashCallback crashCallback_;

    mutable std::mutex crashMutex_;
    std::optional<ProcessCrash> crash_;

    std::mutex diagnosticsMutex_;
    std::map<std::string, ServiceDiagnostic> lastDiagnostics_;
};

}  // namespace TOE

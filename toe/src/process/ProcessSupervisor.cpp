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

#include "process/ProcessSupervisor.h"
#include "common/Logger.h"

#include <algorithm>
#include <csignal>
#include <stdexcept>
#include <thread>

namespace TOE {

namespace {

constexpr std::chrono::milliseconds KILL_WAIT{2000};
constexpr std::chrono::milliseconds EXIT_SETTLE{2000};
constexpr std::chrono::milliseconds CRASH_CHECK_SLICE{100};

}  // namespace

ProcessSupervisor::ProcessSupervisor(std::shared_ptr<IHttpClient> httpClient, std::shared_ptr<PortReaper> portReaper,
                                     CrashDetector detector)
    : httpClient_(std::move(httpClient)), portReaper_(std::move(portReaper)), detector_(std::move(detector)) {
    if (!httpClient_) {
        throw std::invalid_argument("ProcessSupervisor requires an HTTP client");
    }
}

ProcessSupervisor::~ProcessSupervisor() {
    try {
        stopAll();
    } catch (const std::exception &e) {
        LOG_ERROR("ProcessSupervisor: Error during shutdown: {}", e.what());
    }
}

void ProcessSupervisor::setOutputSink(OutputSink sink) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    sink_ = std::move(sink);
}

void ProcessSupervisor::setCrashCallback(CrashCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    crashCallback_ = std::move(callback);
}

ServiceProcess &ProcessSupervisor::start(const ServiceSpec &spec) {
    if (spec.command.empty()) {
        throw SetupException(SetupError{"No launch command configured for " + spec.name, {}});
    }
    if (portReaper_ && spec.port > 0) {
        portReaper_->killProcessOnPort(spec.port);
    }

    auto process = std::make_unique<ServiceProcess>(spec);
    ServiceProcess &ref = *process;
    {
        std::lock_guard<std::mutex> lock(processesMutex_);
        processes_.push_back(std::move(process));
    }

    ref.launch([this](ServiceProcess &proc, const OutputLine &line) { handleLine(proc, line); },
               [this](ServiceProcess &proc) { handleClosed(proc); });
    return ref;
}

void ProcessSupervisor::handleLine(ServiceProcess &process, const OutputLine &line) {
    const bool isStderr = line.stream == OutputStream::Stderr;
    const bool harmless = isStderr && CrashDetector::isHarmless(line.text);
    const bool important = isStderr ? !harmless : CrashDetector::isImportant(line.text);

    OutputSink sink;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        sink = sink_;
    }
    if (sink) {
        sink(process.name(), line, important);
    }

    if (isStderr && !harmless) {
        LOG_WARN("[{}] {}", process.name(), line.text);
    } else if (important && !verbose_) {
        LOG_INFO("[{}] {}", process.name(), line.text);
    } else {
        LOG_DEBUG("[{}] {}", process.name(), line.text);
    }

    // Pure substring scan; runs before the next line is taken off the channel
    auto signature = detector_.scan(line.text);
    if (signature) {
        recordCrash(process, ProcessCrash{process.name(), *signature, line.text, -1});
    }
}

void ProcessSupervisor::handleClosed(ServiceProcess &process) {
    if (!process.waitForExit(EXIT_SETTLE)) {
        LOG_DEBUG("{} closed its output but is still running", process.name());
        return;
    }

    auto state = process.state();
    if (state != ServiceState::Starting && state != ServiceState::Ready) {
        return;
    }

    int code = process.exitCode().value_or(-1);
    if (code != 0) {
        recordCrash(process, ProcessCrash{process.name(), "", "", code});
    } else {
        LOG_WARN("{} exited with code 0 while supervised", process.name());
        process.setState(ServiceState::Stopped);
    }
}

void ProcessSupervisor::recordCrash(ServiceProcess &process, ProcessCrash crash) {
    // Output produced while stopping is not a crash
    if (!process.markCrashed()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(crashMutex_);
        if (crash_) {
            return;
        }
        crash_ = crash;
    }

    if (crash.signature.empty()) {
        LOG_CRITICAL("{} exited with code {} - stopping all services", crash.service, crash.exitCode);
    } else {
        LOG_CRITICAL("{} crashed ('{}'): {} - stopping all services", crash.service, crash.signature, crash.line);
    }
    terminateAll(process);

    CrashCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callback = crashCallback_;
    }
    if (callback) {
        callback(crash);
    }
}

void ProcessSupervisor::terminateAll(const ServiceProcess &origin) {
    for (ServiceProcess *process : snapshot()) {
        bool takenDown = false;
        if (process != &origin) {
            auto state = process->state();
            if (state == ServiceState::Starting || state == ServiceState::Ready) {
                process->setState(ServiceState::Stopping);
                takenDown = true;
            }
        }
        if (process->sendSignal(SIGKILL)) {
            LOG_WARN("Killed {} (pid {})", process->name(), process->pid());
        }
        if (!takenDown) {
            continue;
        }
        // Peers end in Stopped once reaped; the origin stays Crashed
        if (process->waitForExit(KILL_WAIT)) {
            process->setState(ServiceState::Stopped);
        } else {
            LOG_ERROR("{} (pid {}) did not exit after SIGKILL", process->name(), process->pid());
        }
    }
}

std::vector<ServiceProcess *> ProcessSupervisor::snapshot() const {
    std::lock_guard<std::mutex> lock(processesMutex_);
    std::vector<ServiceProcess *> result;
    result.reserve(processes_.size());
    for (const auto &process : processes_) {
        result.push_back(process.get());
    }
    return result;
}

ServiceDiagnostic ProcessSupervisor::probe(ServiceProcess &process, std::chrono::milliseconds timeout) {
    ServiceDiagnostic diagnostic;
    diagnostic.service = process.name();
    diagnostic.healthUrl = process.spec().healthUrl;

    httpClient_->setTimeout(timeout);
    HttpClient::Request request;
    request.method = "GET";
    request.url = process.spec().healthUrl;

    try {
        auto response = httpClient_->sendRequest(request).get();
        diagnostic.lastStatus = response.statusCode;
        if (response.statusCode == 0) {
            diagnostic.lastError = response.errorCode.empty() ? response.errorMessage : response.errorCode;
        } else if (!response.success) {
            diagnostic.lastError = "HTTP " + std::to_string(response.statusCode);
        }
    } catch (const std::exception &e) {
        diagnostic.lastError = e.what();
    }

    diagnostic.alive = process.isAlive();

    std::lock_guard<std::mutex> lock(diagnosticsMutex_);
    lastDiagnostics_[diagnostic.service] = diagnostic;
    return diagnostic;
}

ReadinessResult ProcessSupervisor::awaitReady(const ReadinessPolicy &policy) {
    ReadinessResult result;
    const int maxAttempts = std::max(1, policy.maxAttempts);

    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        throwIfCrashed();
        result.attempts = attempt;

        bool allReady = true;
        for (ServiceProcess *process : snapshot()) {
            if (process->spec().healthUrl.empty() || process->state() == ServiceState::Ready) {
                continue;
            }
            auto diagnostic = probe(*process, policy.requestTimeout);
            if (diagnostic.lastStatus >= 200 && diagnostic.lastStatus < 300) {
                process->setState(ServiceState::Ready);
                LOG_INFO("{} is ready ({})", process->name(), process->spec().healthUrl);
            } else {
                allReady = false;
            }
        }

        throwIfCrashed();
        if (allReady) {
            result.ready = true;
            result.diagnostics = diagnostics();
            return result;
        }

        if (attempt < maxAttempts) {
            LOG_INFO("Services not ready yet (attempt {}/{}), waiting...", attempt, maxAttempts);
            auto deadline = std::chrono::steady_clock::now() + policy.interval;
            while (std::chrono::steady_clock::now() < deadline) {
                throwIfCrashed();
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
                std::this_thread::sleep_for(std::min(remaining, CRASH_CHECK_SLICE));
            }
        }
    }

    result.diagnostics = diagnostics();
    return result;
}

void ProcessSupervisor::startAll(const std::vector<ServiceSpec> &specs, const ReadinessPolicy &policy) {
    for (const auto &spec : specs) {
        start(spec);
    }

    auto result = awaitReady(policy);
    if (!result.ready) {
        LOG_ERROR("Services failed to start after {} attempts", result.attempts);
        for (const auto &diagnostic : result.diagnostics) {
            LOG_ERROR("   {}: status={} error='{}' running={}", diagnostic.service, diagnostic.lastStatus,
                      diagnostic.lastError, diagnostic.alive);
        }
        throw SetupException(SetupError{
            "Services not ready after " + std::to_string(result.attempts) + " attempts", result.diagnostics});
    }
}

void ProcessSupervisor::stop(ServiceProcess &process, std::chrono::milliseconds gracePeriod) {
    const auto initial = process.state();
    if (initial == ServiceState::NotStarted) {
        return;
    }
    if (initial == ServiceState::Stopped && !process.isAlive()) {
        process.joinReaders();
        return;
    }
    const bool crashed = initial == ServiceState::Crashed;

    if (process.isAlive()) {
        if (!crashed) {
            process.setState(ServiceState::Stopping);
        }
        LOG_INFO("Stopping {} (SIGTERM, grace {}ms)", process.name(), gracePeriod.count());
        process.sendSignal(SIGTERM);

        if (!process.waitForExit(gracePeriod)) {
            LOG_WARN("{} still running after {}ms, sending SIGKILL", process.name(), gracePeriod.count());
            process.sendSignal(SIGKILL);
            if (!process.waitForExit(KILL_WAIT)) {
                LOG_ERROR("{} (pid {}) did not exit after SIGKILL", process.name(), process.pid());
            }
        }
    }

    if (!crashed) {
        process.setState(ServiceState::Stopped);
    }
    process.joinReaders();

    if (portReaper_ && process.spec().port > 0) {
        portReaper_->killProcessOnPort(process.spec().port);
    }
}

void ProcessSupervisor::stopAll() {
    auto processes = snapshot();
    for (auto it = processes.rbegin(); it != processes.rend(); ++it) {
        stop(**it, (*it)->spec().gracePeriod);
    }
}

bool ProcessSupervisor::crashed() const {
    std::lock_guard<std::mutex> lock(crashMutex_);
    return crash_.has_value();
}

std::optional<ProcessCrash> ProcessSupervisor::crash() const {
    std::lock_guard<std::mutex> lock(crashMutex_);
    return crash_;
}

void ProcessSupervisor::throwIfCrashed() const {
    auto current = crash();
    if (current) {
        throw ProcessCrashException(*current);
    }
}

std::vector<ServiceDiagnostic> ProcessSupervisor::diagnostics() {
    std::vector<ServiceDiagnostic> result;
    for (ServiceProcess *process : snapshot()) {
        ServiceDiagnostic diagnostic;
        {
            std::lock_guard<std::mutex> lock(diagnosticsMutex_);
            auto it = lastDiagnostics_.find(process->name());
            if (it != lastDiagnostics_.end()) {
                diagnostic = it->second;
            }
        }
        diagnostic.service = process->name();
        diagnostic.healthUrl = process->spec().healthUrl;
        diagnostic.alive = process->isAlive();
        result.push_back(diagnostic);
    }
    return result;
}

ServiceProcess *ProcessSupervisor::find(const std::string &name) {
    std::lock_guard<std::mutex> lock(processesMutex_);
    for (const auto &process : processes_) {
        if (process->name() == name) {
            return process.get();
        }
    }
    return nullptr;
}

size_t ProcessSupervisor::processCount() const {
    std::lock_guard<std::mutex> lock(processesMutex_);
    return processes_.size();
}

}  // namespace TOE

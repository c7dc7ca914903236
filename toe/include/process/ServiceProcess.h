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

#include "process/OutputChannel.h"

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <sys/types.h>
#include <thread>
#include <vector>

namespace TOE {

/**
 * @brief Launch description of one supervised service
 */
struct ServiceSpec {
    std::string name;                                // "backend", "frontend"
    std::string command;                             // run through /bin/sh -c
    std::string workingDirectory;                    // empty = inherit
    std::string healthUrl;                           // empty = no readiness polling
    int port = 0;                                    // reaped before start and after stop, 0 = none
    std::chrono::milliseconds gracePeriod{3000};     // SIGTERM -> SIGKILL escalation delay
    std::map<std::string, std::string> environment;  // added to the inherited environment
};

enum class ServiceState { NotStarted, Starting, Ready, Stopping, Stopped, Crashed };

const char *toString(ServiceState state);

/**
 * @brief One supervised OS process and its output streams
 *
 * The child runs in its own process group so that signals reach the whole
 * tree a shell command spawns. A pump thread moves stdout/stderr lines into
 * an OutputChannel; a single reader loop drains the channel and hands every
 * line to the owner's handler, then reports end of output.
 */
class ServiceProcess {
public:
    using LineHandler = std::function<void(ServiceProcess &, const OutputLine &)>;
    using ClosedHandler = std::function<void(ServiceProcess &)>;

    explicit ServiceProcess(ServiceSpec spec, size_t channelCapacity = 8192);
    ~ServiceProcess();

    ServiceProcess(const ServiceProcess &) = delete;
    ServiceProcess &operator=(const ServiceProcess &) = delete;

    /**
     * @brief fork/exec the command and start the output readers
     * @throws SetupException if pipes cannot be created or fork fails
     */
    void launch(LineHandler onLine, ClosedHandler onClosed);

    const ServiceSpec &spec() const {
        return spec_;
    }

    const std::string &name() const {
        return spec_.name;
    }

    pid_t pid() const {
        return pid_;
    }

    ServiceState state() const;
    void setState(ServiceState state);

    /**
     * @brief Move to Crashed unless a stop is in progress or already done
     * @return true if this call performed the transition
     */
    bool markCrashed();

    /**
     * @brief Reap the child if it exited
     * @return true while the child is still running
     */
    bool isAlive();

    std::optional<int> exitCode() const;

    /**
     * @brief Poll until the child exits or timeout elapses
     * @return true if the child has exited
     */
    bool waitForExit(std::chrono::milliseconds timeout);

    /**
     * @brief Signal the child's process group
     * @return false (and nothing sent) if the child already exited
     */
    bool sendSignal(int signal);

    std::vector<int> signalsSent() const;

    /**
     * @brief Most recent output lines, oldest first
     */
    std::vector<std::string> recentOutput() const;

    /**
     * @brief Stop the pump, drain the channel and join both reader threads
     */
    void joinReaders();

private:
    void pumpLoop(int stdoutFd, int stderrFd);
    void readerLoop();
    void emit(OutputStream stream, std::string &pending, const char *data, size_t size);

    ServiceSpec spec_;
    OutputChannel channel_;
    LineHandler onLine_;
    ClosedHandler onClosed_;

    pid_t pid_ = -1;
    mutable std::mutex stateMutex_;
    ServiceState state_ = ServiceState::NotStarted;

    mutable std::mutex waitMutex_;
    bool exited_ = false;
    std::optional<int> exitCode_;
    std::vector<int> signalsSent_;

    mutable std::mutex tailMutex_;
    std::deque<std::string> tail_;

    std::atomic<bool> stopPump_{false};
    std::thread pumpThread_;
    std::thread readerThread_;
};

}  // namespace TOE

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
#include "process/ICommandRunner.h"
#include <memory>
#include <string>
#include <vector>

namespace TOE {

/**
 * @brief Terminates whatever process is bound to a TCP port
 *
 * Discovery runs POSIX tools first (lsof, then fuser); when neither
 * succeeds it falls back to netstat/taskkill. The first strategy that
 * finds and kills something wins. No process on the port counts as
 * success. killProcessOnPort never throws.
 */
class PortReaper {
public:
    /**
     * @param runner Command runner used for discovery and kills (required)
     * @param sleeper Wait used while confirming the port was released
     * @throws std::invalid_argument if runner is null
     */
    explicit PortReaper(std::shared_ptr<ICommandRunner> runner, RetrySleeper sleeper = {});

    void killProcessOnPort(int port) noexcept;

    /**
     * @brief Unique PIDs from `lsof -t` output (one per line), excluding our own
     */
    static std::vector<std::string> parsePidLines(const std::string &output);

    /**
     * @brief Unique PIDs from `netstat -ano` lines that mention :port
     *
     * The PID is the last column; PID 0 and non-numeric columns are ignored.
     */
    static std::vector<std::string> parseNetstatPids(const std::string &output, int port);

private:
    bool reapWithLsof(int port);
    bool reapWithFuser(int port);
    bool reapWithNetstat(int port);
    void confirmReleased(int port);

    std::shared_ptr<ICommandRunner> runner_;
    RetrySleeper sleeper_;
};

}  // namespace TOE

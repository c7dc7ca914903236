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

#include "process/PortReaper.h"
#include "common/Logger.h"
#include "common/StringUtils.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

namespace TOE {

namespace {

bool isNumeric(const std::string &value) {
    return !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); });
}

void addUnique(std::vector<std::string> &pids, const std::string &pid) {
    if (std::find(pids.begin(), pids.end(), pid) == pids.end()) {
        pids.push_back(pid);
    }
}

}  // namespace

PortReaper::PortReaper(std::shared_ptr<ICommandRunner> runner, RetrySleeper sleeper)
    : runner_(std::move(runner)), sleeper_(std::move(sleeper)) {
    if (!runner_) {
        throw std::invalid_argument("PortReaper requires a command runner");
    }
}

std::vector<std::string> PortReaper::parsePidLines(const std::string &output) {
    std::vector<std::string> pids;
    const std::string self = std::to_string(getpid());
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        std::string pid = trim(line);
        if (isNumeric(pid) && pid != "0" && pid != self) {
            addUnique(pids, pid);
        }
    }
    return pids;
}

std::vector<std::string> PortReaper::parseNetstatPids(const std::string &output, int port) {
    std::vector<std::string> pids;
    const std::string needle = ":" + std::to_string(port);
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        // ":3470" must not match ":34701"
        size_t pos = line.find(needle);
        bool matched = false;
        while (pos != std::string::npos) {
            size_t after = pos + needle.size();
            if (after >= line.size() || !std::isdigit(static_cast<unsigned char>(line[after]))) {
                matched = true;
                break;
            }
            pos = line.find(needle, after);
        }
        if (!matched) {
            continue;
        }

        std::istringstream columns(line);
        std::string column;
        std::string last;
        while (columns >> column) {
            last = column;
        }
        if (isNumeric(last) && last != "0") {
            addUnique(pids, last);
        }
    }
    return pids;
}

void PortReaper::killProcessOnPort(int port) noexcept {
    try {
        LOG_DEBUG("PortReaper: Reaping port {}", port);
        if (reapWithLsof(port)) {
            return;
        }
        if (reapWithFuser(port)) {
            return;
        }
        if (reapWithNetstat(port)) {
            return;
        }
        LOG_DEBUG("PortReaper: No process found on port {}", port);
    } catch (const std::exception &e) {
        LOG_DEBUG("PortReaper: Ignoring error while reaping port {}: {}", port, e.what());
    }
}

bool PortReaper::reapWithLsof(int port) {
    auto result = runner_->run("lsof -ti tcp:" + std::to_string(port) + " -sTCP:LISTEN");
    if (!result.success()) {
        return false;
    }
    auto pids = parsePidLines(result.output);
    if (pids.empty()) {
        return false;
    }

    LOG_INFO("PortReaper: Killing process(es) {} on port {}", joinList(pids, " "), port);
    auto killResult = runner_->run("kill -9 " + joinList(pids, " "));
    if (!killResult.success()) {
        return false;
    }
    confirmReleased(port);
    return true;
}

bool PortReaper::reapWithFuser(int port) {
    auto result = runner_->run("fuser -k " + std::to_string(port) + "/tcp");
    if (!result.success()) {
        return false;
    }
    LOG_INFO("PortReaper: fuser released port {}", port);
    confirmReleased(port);
    return true;
}

bool PortReaper::reapWithNetstat(int port) {
    auto result = runner_->run("netstat -ano | findstr :" + std::to_string(port));
    if (!result.success() || result.output.empty()) {
        return false;
    }

    auto pids = parseNetstatPids(result.output, port);
    for (const auto &pid : pids) {
        LOG_INFO("PortReaper: Killing process {} on port {}", pid, port);
        // Process may already be gone; outcome does not matter
        auto killResult = runner_->run("taskkill /PID " + pid + " /F");
        if (!killResult.success()) {
            LOG_DEBUG("PortReaper: taskkill {} exited {}", pid, killResult.exitCode);
        }
    }
    return true;
}

void PortReaper::confirmReleased(int port) {
    auto outcome = Retry::run(
        RetryPolicy::forPortRelease(),
        [this, port](std::string &error) {
            auto probe = runner_->run("lsof -ti tcp:" + std::to_string(port) + " -sTCP:LISTEN");
            if (probe.success() && !parsePidLines(probe.output).empty()) {
                error = "port still bound";
                return false;
            }
            return true;
        },
        {}, sleeper_);

    if (!outcome.succeeded) {
        LOG_WARN("PortReaper: Port {} still bound after {} checks", port, outcome.attempts);
    }
}

}  // namespace TOE

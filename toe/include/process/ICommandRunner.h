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

#include <memory>
#include <string>

namespace TOE {

/**
 * @brief Result of a one-shot shell command
 */
struct CommandResult {
    bool launched = false;  // false when the shell could not be started
    int exitCode = -1;
    std::string output;     // captured stdout; stderr is discarded

    bool success() const {
        return launched && exitCode == 0;
    }
};

/**
 * @brief Runs short-lived discovery commands (lsof, fuser, netstat)
 *
 * Abstracted so port reaping can be exercised without touching real processes.
 */
class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;

    virtual CommandResult run(const std::string &command) = 0;
};

/**
 * @brief ICommandRunner backed by popen()
 */
class ShellCommandRunner : public ICommandRunner {
public:
    CommandResult run(const std::string &command) override;
};

}  // namespace TOE

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
#include "process/ICommandRunner.h"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace TOE {

/**
 * @brief One install or build command of the system under test
 */
struct BuildStep {
    std::string name;
    std::string command;
    bool required = true;  // false: a failure is logged and the next step runs
};

/**
 * @brief Installs dependencies and builds the services before they are started
 *
 * Steps run in order from the project root through the command runner, with
 * stderr folded into the captured output. The first failing required step
 * stops the sequence.
 */
class ServiceBuilder {
public:
    /**
     * @throws std::invalid_argument if commands is null
     */
    ServiceBuilder(std::shared_ptr<ICommandRunner> commands, std::filesystem::path projectRoot);

    /**
     * @throws BuildException carrying the step, exit code and output of the first failing required step
     */
    void build(const std::vector<BuildStep> &steps);

    /**
     * @brief install:all, native sqlite rebuild (optional), packages, backend, frontend
     */
    static std::vector<BuildStep> defaultSteps();

    /**
     * @brief Parse "name=command;name=command"; a bare command is named after its position
     * @throws ConfigurationException on an empty command
     */
    static std::vector<BuildStep> parseSteps(const std::string &value);

    /**
     * @brief Shell line that runs command inside dir with stderr merged into stdout
     */
    static std::string commandLine(const std::filesystem::path &dir, const std::string &command);

private:
    std::shared_ptr<ICommandRunner> commands_;
    std::filesystem::path projectRoot_;
};

}  // namespace TOE

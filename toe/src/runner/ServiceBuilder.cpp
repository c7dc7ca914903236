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

#include "runner/ServiceBuilder.h"
#include "common/Logger.h"
#include "common/StringUtils.h"

#include <stdexcept>

namespace TOE {

namespace {

constexpr size_t OUTPUT_PREVIEW_LINES = 40;

std::string shellQuote(const std::string &value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    return quoted + "'";
}

}  // namespace

ServiceBuilder::ServiceBuilder(std::shared_ptr<ICommandRunner> commands, std::filesystem::path projectRoot)
    : commands_(std::move(commands)), projectRoot_(std::move(projectRoot)) {
    if (!commands_) {
        throw std::invalid_argument("ServiceBuilder requires a command runner");
    }
}

std::vector<BuildStep> ServiceBuilder::defaultSteps() {
    return {{"install", "npm run install:all", true},
            {"sqlite", "cd backend-server && (node scripts/smart-rebuild-sqlite.js || npm rebuild better-sqlite3)",
             false},
            {"packages", "npm run build:packages", true},
            {"backend", "npm run build:backend", true},
            {"frontend", "npm run build:frontend", true}};
}

std::vector<BuildStep> ServiceBuilder::parseSteps(const std::string &value) {
    std::vector<BuildStep> steps;
    for (const auto &entry : splitList(value, ';')) {
        BuildStep step;
        auto eq = entry.find('=');
        // "name=cmd" only when the part before '=' is a plain word
        if (eq != std::string::npos && entry.find_first_of(" \t") > eq) {
            step.name = trim(entry.substr(0, eq));
            step.command = trim(entry.substr(eq + 1));
        } else {
            step.name = "step" + std::to_string(steps.size() + 1);
            step.command = entry;
        }
        if (step.command.empty()) {
            throw ConfigurationException("Build step '" + step.name + "' has no command");
        }
        steps.push_back(std::move(step));
    }
    return steps;
}

std::string ServiceBuilder::commandLine(const std::filesystem::path &dir, const std::string &command) {
    // The inner redirect survives any redirect the runner appends to the whole line
    std::string line = "( ";
    if (!dir.empty()) {
        line += "cd " + shellQuote(dir.string()) + " && ";
    }
    return line + "( " + command + " ) 2>&1 )";
}

void ServiceBuilder::build(const std::vector<BuildStep> &steps) {
    if (steps.empty()) {
        return;
    }
    LOG_INFO("Preparing services: {} build step(s)", steps.size());

    for (size_t i = 0; i < steps.size(); ++i) {
        const auto &step = steps[i];
        LOG_INFO("   Step {}/{}: {} ({})", i + 1, steps.size(), step.name, step.command);

        CommandResult result = commands_->run(commandLine(projectRoot_, step.command));
        if (result.success()) {
            LOG_DEBUG("   {} output:\n{}", step.name, truncateLines(result.output, OUTPUT_PREVIEW_LINES));
            continue;
        }

        const int exitCode = result.launched ? result.exitCode : -1;
        if (!step.required) {
            LOG_WARN("   Optional step {} failed (exit {}), continuing", step.name, exitCode);
            continue;
        }

        LOG_ERROR("Build step {} failed (exit {}):\n{}", step.name, exitCode,
                  truncateLines(result.output, OUTPUT_PREVIEW_LINES));
        throw BuildException(BuildFailure{step.name, step.command, exitCode, result.output});
    }
    LOG_INFO("All services built successfully");
}

}  // namespace TOE

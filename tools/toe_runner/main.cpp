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

#include "api/BuiltinGroups.h"
#include "common/HarnessErrors.h"
#include "common/Logger.h"
#include "common/StringUtils.h"
#include "http/CppHttplibClient.h"
#include "process/ICommandRunner.h"
#include "runner/HarnessConfig.h"
#include "runner/Runner.h"

#include <atomic>
#include <csignal>
#include <cstdio>
#include <memory>

namespace {

std::atomic<TOE::Runner *> activeRunner{nullptr};

extern "C" void handleStopSignal(int) {
    TOE::Runner *runner = activeRunner.load();
    if (runner != nullptr) {
        runner->requestStop();
    }
}

}  // namespace

/**
 * @brief Integration test orchestration CLI
 *
 * Exit code 0 only when every selected test passed and no suite-level,
 * setup or service failure occurred.
 */
int main(int argc, char *argv[]) {
    try {
        auto config = TOE::HarnessConfig::fromEnvironment();
        config.applyCommandLine(argc, argv);

        if (config.showHelp) {
            printf("%s", TOE::HarnessConfig::usage(argv[0]).c_str());
            return 0;
        }

        TOE::Logger::initialize(config.reportsDir.string(), !config.listGroups);

        std::shared_ptr<TOE::IHttpClient> http = TOE::createHttpClient();
        auto runner = std::make_unique<TOE::Runner>(config, http, std::make_shared<TOE::ShellCommandRunner>());
        TOE::registerBuiltinGroups(runner->registry(), http, config.credentials);

        if (config.listGroups) {
            for (const auto &group : runner->registry().groups()) {
                printf("%-14s %-18s tests=%-3d deps=[%s]\n", group.name.c_str(), group.displayName.c_str(),
                       group.declaredTests, TOE::joinList(group.dependencies).c_str());
            }
            return 0;
        }

        activeRunner.store(runner.get());
        std::signal(SIGINT, handleStopSignal);
        std::signal(SIGTERM, handleStopSignal);

        int exitCode = runner->run();

        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
        activeRunner.store(nullptr);
        TOE::Logger::flush();
        return exitCode;

    } catch (const TOE::ConfigurationException &e) {
        fprintf(stderr, "Error: %s\n\n%s", e.what(), TOE::HarnessConfig::usage(argv[0]).c_str());
        return 1;
    } catch (const std::exception &e) {
        fprintf(stderr, "FATAL ERROR: %s\n", e.what());
        return 1;
    }
}

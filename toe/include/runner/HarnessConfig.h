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

#include "api/SessionSetup.h"
#include "runner/ServiceBuilder.h"
#include "scheduling/TestSelector.h"

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace TOE {

/**
 * @brief Everything a run is configured with
 *
 * Built from the environment first, then refined by the command line.
 */
struct HarnessConfig {
    using EnvLookup = std::function<std::optional<std::string>(const std::string &)>;

    std::string baseUrl = "http://127.0.0.1:3498";
    std::string backendHealthUrl = "http://127.0.0.1:3470/health";
    std::string frontendHealthUrl = "http://127.0.0.1:3498/api/health";
    Credentials credentials{"admin", "admin123"};

    bool verbose = false;
    bool hidePassed = false;
    bool cleanupAfterRun = true;
    bool stopOnFirstFailure = false;
    bool manageServices = true;
    bool writeTranscript = true;
    bool configureApp = true;  // write test CORS/rate-limit settings before starting services

    std::filesystem::path projectRoot;
    std::filesystem::path dataDir;
    std::filesystem::path reportsDir;
    std::string backendCommand = "npm run dev:backend";
    std::string frontendCommand = "npm run dev:frontend";
    std::vector<BuildStep> buildSteps = ServiceBuilder::defaultSteps();  // empty: no build

    int expectedTotalTests = 0;  // 0: the registry's declared count
    int maxCleanupWarnings = 0;  // 0: leftovers never fail the run

    SelectionOptions selection;
    bool listGroups = false;
    bool showHelp = false;

    static HarnessConfig fromEnvironment();

    /**
     * @throws ConfigurationException on malformed values
     */
    static HarnessConfig fromLookup(const EnvLookup &lookup);

    /**
     * @brief Apply command-line flags on top of the environment
     * @throws ConfigurationException on unknown flags or missing values
     */
    void applyCommandLine(int argc, char *argv[]);

    static std::string usage(const std::string &program);

    /**
     * @brief Port a service listens on, taken from its health URL
     */
    static int portOf(const std::string &url, int fallback);

    int backendPort() const {
        return portOf(backendHealthUrl, 3470);
    }

    int frontendPort() const {
        return portOf(frontendHealthUrl, 3498);
    }

    /**
     * @brief Environment descriptor for the run report (no secrets)
     */
    std::map<std::string, std::string> describe() const;

    /**
     * @brief 1/true/yes/on (any case) is true, 0/false/no/off is false
     */
    static bool parseBool(const std::string &value, bool fallback);
};

}  // namespace TOE

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

#include "runner/HarnessConfig.h"
#include "common/HarnessErrors.h"
#include "common/StringUtils.h"
#include "http/CppHttplibClient.h"

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace TOE {

namespace {

int parseCount(const std::string &name, const std::string &value) {
    try {
        size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (used != value.size() || parsed < 0) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception &) {
        throw ConfigurationException(name + " must be a non-negative integer, got '" + value + "'");
    }
}

}  // namespace

bool HarnessConfig::parseBool(const std::string &value, bool fallback) {
    const std::string normalized = toLower(trim(value));
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
        return false;
    }
    return fallback;
}

HarnessConfig HarnessConfig::fromEnvironment() {
    return fromLookup([](const std::string &name) -> std::optional<std::string> {
        const char *value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    });
}

HarnessConfig HarnessConfig::fromLookup(const EnvLookup &lookup) {
    HarnessConfig config;
    auto text = [&lookup](const std::string &name, std::string &field) {
        if (auto value = lookup(name); value && !value->empty()) {
            field = *value;
        }
    };
    auto flag = [&lookup](const std::string &name, bool &field) {
        if (auto value = lookup(name)) {
            field = parseBool(*value, field);
        }
    };

    text("TOE_BASE_URL", config.baseUrl);
    text("TOE_BACKEND_HEALTH_URL", config.backendHealthUrl);
    text("TOE_FRONTEND_HEALTH_URL", config.frontendHealthUrl);
    text("TOE_ADMIN_USERNAME", config.credentials.username);
    text("TOE_ADMIN_PASSWORD", config.credentials.password);
    text("TOE_BACKEND_CMD", config.backendCommand);
    text("TOE_FRONTEND_CMD", config.frontendCommand);

    flag("VERBOSE", config.verbose);
    flag("HIDE_PASSED", config.hidePassed);
    flag("TOE_CLEANUP_AFTER_RUN", config.cleanupAfterRun);
    flag("STOP_ON_FIRST_FAILURE", config.stopOnFirstFailure);
    flag("TOE_MANAGE_SERVICES", config.manageServices);
    flag("TOE_WRITE_TRANSCRIPT", config.writeTranscript);
    flag("TOE_CONFIGURE_APP", config.configureApp);

    // Set but empty means "no build steps"
    if (auto value = lookup("TOE_BUILD_STEPS")) {
        config.buildSteps = ServiceBuilder::parseSteps(*value);
    }
    bool skipBuild = false;
    flag("TOE_SKIP_BUILD", skipBuild);
    if (skipBuild) {
        config.buildSteps.clear();
    }

    const auto cwd = std::filesystem::current_path();
    std::string projectRoot = cwd.string();
    text("TOE_PROJECT_ROOT", projectRoot);
    config.projectRoot = projectRoot;

    std::string dataDir = (config.projectRoot / "backend-server" / "data").string();
    text("TOE_DATA_DIR", dataDir);
    config.dataDir = dataDir;

    std::string reportsDir = (cwd / "test-logs").string();
    text("TOE_REPORTS_DIR", reportsDir);
    config.reportsDir = reportsDir;

    if (auto value = lookup("TOE_EXPECTED_TOTAL"); value && !value->empty()) {
        config.expectedTotalTests = parseCount("TOE_EXPECTED_TOTAL", *value);
    }
    if (auto value = lookup("TOE_MAX_CLEANUP_WARNINGS"); value && !value->empty()) {
        config.maxCleanupWarnings = parseCount("TOE_MAX_CLEANUP_WARNINGS", *value);
    }
    return config;
}

void HarnessConfig::applyCommandLine(int argc, char *argv[]) {
    auto valueOf = [&](int &i, const std::string &arg, const std::string &flagName) -> std::string {
        if (arg.size() > flagName.size() && arg[flagName.size()] == '=') {
            return arg.substr(flagName.size() + 1);
        }
        if (i + 1 >= argc) {
            throw ConfigurationException(flagName + " requires a value");
        }
        return argv[++i];
    };
    auto append = [](std::vector<std::string> &target, const std::vector<std::string> &values) {
        target.insert(target.end(), values.begin(), values.end());
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            showHelp = true;
        } else if (arg == "--list") {
            listGroups = true;
        } else if (arg == "--stop-on-first-failure") {
            stopOnFirstFailure = true;
        } else if (arg == "--skip-build") {
            buildSteps.clear();
        } else if (arg == "--only-failing") {
            selection.onlyFailing = true;
        } else if (arg == "--only" || startsWith(arg, "--only=")) {
            append(selection.only, splitList(valueOf(i, arg, "--only")));
        } else if (arg == "--skip" || startsWith(arg, "--skip=")) {
            append(selection.skip, splitList(valueOf(i, arg, "--skip")));
        } else if (startsWith(arg, "-")) {
            throw ConfigurationException("Unknown option: " + arg);
        } else {
            append(selection.only, splitList(arg));
        }
    }
}

std::string HarnessConfig::usage(const std::string &program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options] [group ...]\n"
        << "\n"
        << "Integration test orchestration: reconcile state, start services, run test groups, report.\n"
        << "\n"
        << "Options:\n"
        << "  --only a,b               Run only these groups (plus their dependencies)\n"
        << "  --skip a,b               Do not run these groups\n"
        << "  --only-failing           Re-run the groups that failed in the latest report\n"
        << "  --stop-on-first-failure  Abort at the first failing test\n"
        << "  --skip-build             Start the services without installing or building them\n"
        << "  --list                   List registered groups and exit\n"
        << "  -h, --help               Show this help message\n"
        << "\n"
        << "Environment:\n"
        << "  TOE_BASE_URL, TOE_BACKEND_HEALTH_URL, TOE_FRONTEND_HEALTH_URL\n"
        << "  TOE_ADMIN_USERNAME, TOE_ADMIN_PASSWORD\n"
        << "  TOE_PROJECT_ROOT, TOE_DATA_DIR, TOE_REPORTS_DIR\n"
        << "  TOE_BACKEND_CMD, TOE_FRONTEND_CMD, TOE_MANAGE_SERVICES\n"
        << "  TOE_BUILD_STEPS (name=cmd;name=cmd), TOE_SKIP_BUILD, TOE_CONFIGURE_APP\n"
        << "  TOE_CLEANUP_AFTER_RUN, TOE_WRITE_TRANSCRIPT, TOE_EXPECTED_TOTAL, TOE_MAX_CLEANUP_WARNINGS\n"
        << "  VERBOSE, HIDE_PASSED, STOP_ON_FIRST_FAILURE, SPDLOG_LEVEL\n"
        << "\n"
        << "Exit code: 0 when every test passed and no suite or service failure occurred, 1 otherwise.\n";
    return out.str();
}

int HarnessConfig::portOf(const std::string &url, int fallback) {
    auto [scheme, host, port, path] = CppHttplibClient::parseUrl(url);
    return scheme.empty() || port <= 0 ? fallback : port;
}

std::map<std::string, std::string> HarnessConfig::describe() const {
    std::vector<std::string> stepNames;
    for (const auto &step : buildSteps) {
        stepNames.push_back(step.name);
    }
    return {{"buildSteps", joinList(stepNames)},
            {"configureApp", configureApp ? "true" : "false"},
            {"baseUrl", baseUrl},
            {"backendHealthUrl", backendHealthUrl},
            {"frontendHealthUrl", frontendHealthUrl},
            {"adminUsername", credentials.username},
            {"projectRoot", projectRoot.string()},
            {"dataDir", dataDir.string()},
            {"reportsDir", reportsDir.string()},
            {"manageServices", manageServices ? "true" : "false"},
            {"stopOnFirstFailure", stopOnFirstFailure ? "true" : "false"},
            {"cleanupAfterRun", cleanupAfterRun ? "true" : "false"},
            {"verbose", verbose ? "true" : "false"}};
}

}  // namespace TOE

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

#include "common/JsonUtils.h"

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace TOE {

/**
 * @brief Values the system under test is configured with for a run
 */
struct AppTestSettings {
    std::string frontendUrl;                  // origin, e.g. http://127.0.0.1:3498
    std::string backendUrl;                   // origin, e.g. http://127.0.0.1:3470
    std::vector<std::string> allowedOrigins;  // CORS origins the cors group expects to pass
};

using EnvUpdates = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Writes test configuration into the project under test
 *
 * - config/krapi-config.json: allowed origins, CORS on, rate limiting off,
 *   service URLs (other keys are preserved)
 * - .env, frontend-manager/.env.local, backend-server/.env: the same values
 *   as environment variables; existing keys are rewritten in place and the
 *   rest appended. An .env file is created only where its directory exists.
 *
 * Failures are logged as warnings: the services then run with their own
 * configuration.
 */
class AppConfigurator {
public:
    explicit AppConfigurator(std::filesystem::path projectRoot);

    /**
     * @return false if any file could not be written (logged, never thrown)
     */
    bool configure(const AppTestSettings &settings) noexcept;

    static AppTestSettings defaultSettings(const std::string &frontendUrl, const std::string &backendUrl);

    static json applySettings(json config, const AppTestSettings &settings);

    /**
     * @brief Rewrite KEY=value lines of an .env text; comments and unknown keys are kept
     */
    static std::string updateEnvContent(const std::string &content, const EnvUpdates &updates);

    /**
     * @brief Local origins of both services followed by the configured ones, without duplicates
     */
    static std::vector<std::string> originsWithLocalhost(const AppTestSettings &settings);

    /**
     * @brief scheme://host[:port] part of a URL; empty when it does not parse
     */
    static std::string originOf(const std::string &url);

    const std::filesystem::path &configPath() const {
        return configPath_;
    }

private:
    void writeConfig(const AppTestSettings &settings);
    void updateEnvFile(const std::filesystem::path &path, const EnvUpdates &updates);

    std::filesystem::path projectRoot_;
    std::filesystem::path configPath_;
};

}  // namespace TOE

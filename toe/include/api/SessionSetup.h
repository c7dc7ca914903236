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

#include "api/ApiClient.h"
#include "common/RunContext.h"
#include "http/IHttpClient.h"
#include "scheduling/TestGroup.h"

#include <memory>
#include <string>

namespace TOE {

struct Credentials {
    std::string username;
    std::string password;
};

/**
 * @brief One-time session preparation before the first test group
 *
 * connect -> login -> scratch project -> scratch collection, each step
 * only when required and not already present in the session. Any failure
 * is a SetupException.
 */
class SessionSetup {
public:
    SessionSetup(std::shared_ptr<IHttpClient> http, RunContext &run, std::string healthUrl, Credentials credentials);

    /**
     * @throws SetupException when a required step fails
     */
    void prepare(const InitRequirements &requirements);

    void operator()(const InitRequirements &requirements) {
        prepare(requirements);
    }

private:
    void connect();
    void login();
    void createProject();
    void createCollection();

    [[noreturn]] void fail(const std::string &step, const std::string &detail, int status = 0) const;

    std::shared_ptr<IHttpClient> http_;
    RunContext &run_;
    ApiClient api_;
    std::string healthUrl_;
    Credentials credentials_;
};

}  // namespace TOE

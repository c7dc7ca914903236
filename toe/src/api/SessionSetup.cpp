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

#include "api/SessionSetup.h"
#include "common/HarnessErrors.h"
#include "common/Logger.h"

#include <chrono>
#include <stdexcept>

namespace TOE {

namespace {

std::string uniqueSuffix() {
    return std::to_string(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
            .count());
}

}  // namespace

SessionSetup::SessionSetup(std::shared_ptr<IHttpClient> http, RunContext &run, std::string healthUrl,
                           Credentials credentials)
    : http_(std::move(http)), run_(run), api_(http_, run.session()), healthUrl_(std::move(healthUrl)),
      credentials_(std::move(credentials)) {}

void SessionSetup::prepare(const InitRequirements &requirements) {
    connect();
    if (requirements.needsAuth || requirements.needsProject || requirements.needsCollection) {
        login();
    }
    if (requirements.needsProject || requirements.needsCollection) {
        createProject();
    }
    if (requirements.needsCollection) {
        createCollection();
    }
}

void SessionSetup::fail(const std::string &step, const std::string &detail, int status) const {
    SetupError error;
    error.message = step + " failed: " + detail;
    ServiceDiagnostic target;
    target.service = "target";
    target.healthUrl = healthUrl_;
    target.lastStatus = status;
    target.lastError = detail;
    target.alive = run_.session().connected;
    error.services.push_back(target);
    throw SetupException(error);
}

void SessionSetup::connect() {
    auto &session = run_.session();
    if (session.connected) {
        return;
    }
    LOG_INFO("Connecting to {}", healthUrl_);

    HttpClient::Request request;
    request.method = "GET";
    request.url = healthUrl_;
    auto response = http_->sendRequest(request).get();
    if (!response.success) {
        fail("Connect", response.statusCode == 0 ? response.errorMessage + " (" + response.errorCode + ")"
                                                 : "HTTP " + std::to_string(response.statusCode),
             response.statusCode);
    }
    session.connected = true;
}

void SessionSetup::login() {
    auto &session = run_.session();
    if (session.hasToken()) {
        LOG_DEBUG("Reusing existing session token");
        return;
    }
    LOG_INFO("Logging in as {}", credentials_.username);

    try {
        auto response = api_.post("/api/krapi/k1/auth/login",
                                  {{"username", credentials_.username}, {"password", credentials_.password}}, false);
        auto payload = JsonUtils::parseJson(response.body);
        std::string token;
        if (payload && payload->is_object()) {
            token = JsonUtils::getString(*payload, "session_token");
            if (token.empty() && payload->contains("data") && (*payload)["data"].is_object()) {
                token = JsonUtils::getString((*payload)["data"], "session_token");
            }
        }
        if (token.empty()) {
            fail("Login", "response has no session_token", response.statusCode);
        }
        session.sessionToken = token;
    } catch (const ApiException &e) {
        fail("Login", e.what(), e.statusCode());
    }
}

void SessionSetup::createProject() {
    auto &session = run_.session();
    if (session.hasProject()) {
        LOG_DEBUG("Reusing project {}", session.projectId);
        return;
    }

    const std::string name = "Test Project " + uniqueSuffix();
    try {
        auto response = api_.post("/api/krapi/k1/projects",
                                  {{"name", name}, {"description", "Scratch project for the integration run"}});
        auto payload = JsonUtils::parseJson(response.body);
        std::string id = payload ? JsonUtils::findId(*payload) : "";
        if (id.empty()) {
            fail("Project creation", "response has no project id", response.statusCode);
        }
        session.projectId = id;
        session.projectName = name;
        run_.rememberCreatedProject(id);
        LOG_INFO("Created test project {} ({})", name, id);
    } catch (const ApiException &e) {
        fail("Project creation", e.what(), e.statusCode());
    }
}

void SessionSetup::createCollection() {
    auto &session = run_.session();
    if (session.hasCollection()) {
        LOG_DEBUG("Reusing collection {}", session.collectionName);
        return;
    }

    const std::string name = "test_collection_" + uniqueSuffix();
    json fields = json::array({{{"name", "title"}, {"type", "string"}, {"required", true}},
                               {{"name", "value"}, {"type", "number"}, {"required", false}}});
    try {
        auto response = api_.post("/api/krapi/k1/projects/" + session.projectId + "/collections",
                                  {{"name", name}, {"description", "Scratch collection"}, {"fields", fields}});
        auto payload = JsonUtils::parseJson(response.body);
        session.collectionName = name;
        session.collectionId = payload ? JsonUtils::findId(*payload) : "";
        LOG_INFO("Created test collection {}", name);
    } catch (const ApiException &e) {
        fail("Collection creation", e.what(), e.statusCode());
    }
}

}  // namespace TOE

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
#include "api/ApiClient.h"
#include "common/HarnessErrors.h"
#include "common/StringUtils.h"
#include "scheduling/TestSuiteContext.h"

#include <chrono>
#include <stdexcept>

namespace TOE {

namespace {

const std::string API = "/api/krapi/k1";

std::string headerValue(const HttpClient::Response &response, const std::string &name) {
    for (const auto &[key, value] : response.headers) {
        if (toLower(key) == toLower(name)) {
            return value;
        }
    }
    return "";
}

std::string stamp() {
    return std::to_string(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
            .count());
}

std::string collectionPath(const SessionState &session) {
    return API + "/projects/" + session.projectId + "/collections/" + session.collectionName;
}

void healthTests(TestSuiteContext &suite, const std::shared_ptr<IHttpClient> &http) {
    ApiClient api(http, suite.session());

    suite.test("Health endpoint responds", [&] {
        auto response = api.get(API + "/health", false);
        suite.check(response.success, "Health endpoint should return 2xx");
    });

    suite.test("Health payload is a JSON object", [&] {
        auto response = api.get(API + "/health", false);
        auto body = ApiClient::parseBody(response, "GET", api.urlFor(API + "/health"));
        suite.check(body.is_object(), "Health payload should be an object");
    });
}

void authTests(TestSuiteContext &suite, const std::shared_ptr<IHttpClient> &http, const std::string &username,
               const std::string &password) {
    ApiClient api(http, suite.session());

    suite.test("Login with admin credentials returns a session token", [&] {
        auto response = api.post(API + "/auth/login", {{"username", username}, {"password", password}}, false);
        auto body = ApiClient::parseBody(response);
        suite.check(body.is_object() && !JsonUtils::getString(body, "session_token").empty(),
                    "Login response should contain session_token");
    });

    suite.test("Login with a wrong password is rejected", [&] {
        auto response = api.send("POST", API + "/auth/login",
                                 json{{"username", username}, {"password", "wrong-" + stamp()}}, false, {}, false);
        suite.check(response.statusCode >= 400 && response.statusCode < 500,
                    "Wrong password should be rejected with 4xx, got " + std::to_string(response.statusCode));
    });

    suite.test("Session token authorizes API calls", [&] {
        auto response = api.get(API + "/projects");
        suite.check(response.success, "Authenticated request should succeed");
    });
}

void projectTests(TestSuiteContext &suite, const std::shared_ptr<IHttpClient> &http) {
    ApiClient api(http, suite.session());
    const auto &session = suite.session();

    suite.test("List projects includes the test project", [&] {
        auto body = ApiClient::parseBody(api.get(API + "/projects"));
        suite.check(body.is_array(), "Should return projects array");
        bool found = false;
        for (const auto &project : body) {
            found = found || JsonUtils::findId(project) == session.projectId;
        }
        suite.check(found, "Test project " + session.projectId + " should be listed");
    });

    suite.test("Get project by ID", [&] {
        auto body = ApiClient::parseBody(api.get(API + "/projects/" + session.projectId));
        suite.check(JsonUtils::findId(body) == session.projectId, "Should return the requested project");
    });

    suite.test("Update project description", [&] {
        const std::string description = "Updated by integration run " + stamp();
        api.put(API + "/projects/" + session.projectId, {{"description", description}});
        auto body = ApiClient::parseBody(api.get(API + "/projects/" + session.projectId));
        suite.check(JsonUtils::getString(body, "description") == description, "Description should be updated");
    });

    suite.test("Delete a throwaway project", [&] {
        auto created = ApiClient::parseBody(api.post(API + "/projects", {{"name", "Throwaway " + stamp()}}));
        const std::string id = JsonUtils::findId(created);
        suite.check(!id.empty(), "Throwaway project should have an ID");
        api.del(API + "/projects/" + id);
        auto response = api.send("GET", API + "/projects/" + id, std::nullopt, true, {}, false);
        suite.check(response.statusCode == 404, "Deleted project should be gone, got " +
                                                     std::to_string(response.statusCode));
    });
}

void collectionTests(TestSuiteContext &suite, const std::shared_ptr<IHttpClient> &http) {
    ApiClient api(http, suite.session());
    const auto &session = suite.session();

    suite.test("List collections includes the test collection", [&] {
        auto body = ApiClient::parseBody(api.get(API + "/projects/" + session.projectId + "/collections"));
        suite.check(body.is_array(), "Should return collections array");
        bool found = false;
        for (const auto &collection : body) {
            found = found || JsonUtils::getString(collection, "name") == session.collectionName;
        }
        suite.check(found, "Collection " + session.collectionName + " should be listed");
    });

    suite.test("Get collection by name", [&] {
        auto body = ApiClient::parseBody(api.get(collectionPath(session)));
        suite.check(JsonUtils::getString(body, "name") == session.collectionName, "Should return the collection");
    });

    suite.test("Collection without a name is rejected", [&] {
        auto response = api.send("POST", API + "/projects/" + session.projectId + "/collections",
                                 json{{"description", "no name"}}, true, {}, false);
        suite.check(response.statusCode >= 400 && response.statusCode < 500,
                    "Missing name should be a validation error, got " + std::to_string(response.statusCode));
    });
}

void documentTests(TestSuiteContext &suite, const std::shared_ptr<IHttpClient> &http) {
    ApiClient api(http, suite.session());
    const auto &session = suite.session();
    std::string documentId;

    suite.test("Create document", [&] {
        auto body = ApiClient::parseBody(
            api.post(collectionPath(session) + "/documents", {{"data", {{"title", "First"}, {"value", 1}}}}));
        documentId = JsonUtils::findId(body);
        suite.check(!documentId.empty(), "Created document should have an ID");
    });

    suite.test("Get document by ID", [&] {
        suite.check(!documentId.empty(), "No document from the previous test");
        auto body = ApiClient::parseBody(api.get(collectionPath(session) + "/documents/" + documentId));
        suite.check(JsonUtils::findId(body) == documentId, "Should return the created document");
    });

    suite.test("List documents", [&] {
        auto body = ApiClient::parseBody(api.get(collectionPath(session) + "/documents"));
        suite.check(body.is_array() || (body.is_object() && body.contains("documents")),
                    "Should return a document list");
    });

    suite.test("Update document", [&] {
        suite.check(!documentId.empty(), "No document from the previous test");
        api.put(collectionPath(session) + "/documents/" + documentId, {{"data", {{"title", "Updated"}}}});
        auto body = ApiClient::parseBody(api.get(collectionPath(session) + "/documents/" + documentId));
        const json data = body.contains("data") && body["data"].is_object() ? body["data"] : body;
        suite.check(JsonUtils::getString(data, "title") == "Updated", "Title should be updated");
    });

    suite.test("Delete document", [&] {
        suite.check(!documentId.empty(), "No document from the previous test");
        api.del(collectionPath(session) + "/documents/" + documentId);
        auto response = api.send("GET", collectionPath(session) + "/documents/" + documentId, std::nullopt, true, {},
                                 false);
        suite.check(response.statusCode == 404, "Deleted document should be gone, got " +
                                                     std::to_string(response.statusCode));
    });
}

void corsTests(TestSuiteContext &suite, const std::shared_ptr<IHttpClient> &http) {
    ApiClient api(http, suite.session());

    suite.test("CORS preflight is answered", [&] {
        auto response = api.send("OPTIONS", API + "/health", std::nullopt, false,
                                 {{"Origin", "http://localhost:3498"}, {"Access-Control-Request-Method", "GET"}},
                                 false);
        suite.check(response.statusCode > 0 && response.statusCode < 500,
                    "Preflight should not fail server-side, got " + std::to_string(response.statusCode));
    });

    suite.test("Disallowed origin is not echoed back", [&] {
        const std::string origin = "https://malicious-attacker.com";
        auto response = api.send("GET", API + "/health", std::nullopt, false, {{"Origin", origin}}, false);
        suite.check(headerValue(response, "Access-Control-Allow-Origin") != origin,
                    "Disallowed origin should not be allowed");
    });
}

}  // namespace

void registerBuiltinGroups(TestRegistry &registry, std::shared_ptr<IHttpClient> http, const Credentials &credentials) {
    if (!http) {
        throw std::invalid_argument("registerBuiltinGroups requires an HTTP client");
    }

    registry.add({"health", "Health", {}, {}, 2, [http](TestSuiteContext &suite) { healthTests(suite, http); }});

    registry.add({"auth", "Authentication", {}, {true, false, false}, 3, [http, credentials](TestSuiteContext &suite) {
                      authTests(suite, http, credentials.username, credentials.password);
                  }});

    registry.add({"projects", "Projects", {"auth"}, {true, true, false}, 4,
                  [http](TestSuiteContext &suite) { projectTests(suite, http); }});

    registry.add({"collections", "Collections", {"auth", "projects"}, {true, true, true}, 3,
                  [http](TestSuiteContext &suite) { collectionTests(suite, http); }});

    registry.add({"documents", "Documents", {"auth", "projects", "collections"}, {true, true, true}, 5,
                  [http](TestSuiteContext &suite) { documentTests(suite, http); }});

    registry.add({"cors", "CORS", {"auth"}, {}, 2, [http](TestSuiteContext &suite) { corsTests(suite, http); }});
}

}  // namespace TOE

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

#include "runner/AppConfigurator.h"
#include "common/Logger.h"
#include "common/StringUtils.h"
#include "http/CppHttplibClient.h"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace TOE {

namespace {

const char *const CONFIG_FILE = "config/krapi-config.json";
constexpr int UNLIMITED = 999999;

std::string readText(const std::filesystem::path &path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("cannot read " + path.string());
    }
    std::ostringstream content;
    content << in.rdbuf();
    return content.str();
}

void writeText(const std::filesystem::path &path, const std::string &content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("cannot open " + path.string());
    }
    out << content;
    if (!out.flush()) {
        throw std::runtime_error("cannot write " + path.string());
    }
}

}  // namespace

AppConfigurator::AppConfigurator(std::filesystem::path projectRoot)
    : projectRoot_(std::move(projectRoot)), configPath_(projectRoot_ / CONFIG_FILE) {}

AppTestSettings AppConfigurator::defaultSettings(const std::string &frontendUrl, const std::string &backendUrl) {
    AppTestSettings settings;
    settings.frontendUrl = originOf(frontendUrl);
    settings.backendUrl = originOf(backendUrl);
    settings.allowedOrigins = {"https://test-allowed.example.com", "https://app1.example.com",
                               "https://app2.example.com", "https://app3.example.com"};
    return settings;
}

std::string AppConfigurator::originOf(const std::string &url) {
    auto [scheme, host, port, path] = CppHttplibClient::parseUrl(url);
    if (scheme.empty()) {
        return "";
    }
    const bool defaultPort = (scheme == "http" && port == 80) || (scheme == "https" && port == 443);
    return defaultPort ? scheme + "://" + host : scheme + "://" + host + ":" + std::to_string(port);
}

std::vector<std::string> AppConfigurator::originsWithLocalhost(const AppTestSettings &settings) {
    std::vector<std::string> origins = {"http://localhost", "http://127.0.0.1"};
    for (const auto &url : {settings.frontendUrl, settings.backendUrl}) {
        auto [scheme, host, port, path] = CppHttplibClient::parseUrl(url);
        if (scheme.empty()) {
            continue;
        }
        origins.push_back(scheme + "://localhost:" + std::to_string(port));
        origins.push_back(scheme + "://127.0.0.1:" + std::to_string(port));
    }
    origins.insert(origins.end(), settings.allowedOrigins.begin(), settings.allowedOrigins.end());

    std::vector<std::string> unique;
    for (const auto &origin : origins) {
        if (std::find(unique.begin(), unique.end(), origin) == unique.end()) {
            unique.push_back(origin);
        }
    }
    return unique;
}

json AppConfigurator::applySettings(json config, const AppTestSettings &settings) {
    if (!config.is_object()) {
        config = json::object();
    }
    for (const char *section : {"security", "frontend", "backend"}) {
        if (!config.contains(section) || !config[section].is_object()) {
            config[section] = json::object();
        }
    }

    config["security"]["allowedOrigins"] = settings.allowedOrigins;
    config["security"]["enableCors"] = true;
    config["security"]["rateLimit"] = {{"enabled", false},
                                       {"windowMs", 900000},
                                       {"loginMax", UNLIMITED},
                                       {"sensitiveMax", UNLIMITED},
                                       {"generalMax", UNLIMITED}};
    config["frontend"]["url"] = settings.frontendUrl;
    config["backend"]["url"] = settings.backendUrl;
    return config;
}

std::string AppConfigurator::updateEnvContent(const std::string &content, const EnvUpdates &updates) {
    std::vector<std::string> lines;
    std::istringstream in(content);
    for (std::string line; std::getline(in, line);) {
        lines.push_back(line);
    }

    std::vector<bool> seen(updates.size(), false);
    for (auto &line : lines) {
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }
        auto eq = trimmed.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        const std::string key = trim(trimmed.substr(0, eq));
        for (size_t i = 0; i < updates.size(); ++i) {
            if (updates[i].first == key) {
                line = key + "=" + updates[i].second;
                seen[i] = true;
            }
        }
    }
    for (size_t i = 0; i < updates.size(); ++i) {
        if (!seen[i]) {
            lines.push_back(updates[i].first + "=" + updates[i].second);
        }
    }

    std::string result;
    for (const auto &line : lines) {
        result += line + "\n";
    }
    return result;
}

void AppConfigurator::writeConfig(const AppTestSettings &settings) {
    json config = json::object();
    if (std::filesystem::exists(configPath_)) {
        std::string error;
        auto parsed = JsonUtils::parseFile(configPath_.string(), &error);
        if (parsed) {
            config = *parsed;
        } else {
            LOG_WARN("AppConfigurator: {} is not valid JSON ({}), rewriting it", configPath_.string(), error);
        }
    }
    std::filesystem::create_directories(configPath_.parent_path());
    writeText(configPath_, JsonUtils::toPrettyString(applySettings(std::move(config), settings)) + "\n");
    LOG_INFO("   Configuration file updated: {}", configPath_.string());
}

void AppConfigurator::updateEnvFile(const std::filesystem::path &path, const EnvUpdates &updates) {
    if (!std::filesystem::is_directory(path.parent_path())) {
        LOG_DEBUG("AppConfigurator: {} has no directory, skipped", path.string());
        return;
    }
    const std::string current = std::filesystem::exists(path) ? readText(path) : "";
    writeText(path, updateEnvContent(current, updates));
    LOG_DEBUG("AppConfigurator: Synced {}", path.string());
}

bool AppConfigurator::configure(const AppTestSettings &settings) noexcept {
    LOG_INFO("Configuring app for tests...");
    bool ok = true;

    try {
        writeConfig(settings);
    } catch (const std::exception &e) {
        LOG_WARN("Could not write {}: {} (continuing with the app's own configuration)", configPath_.string(),
                 e.what());
        ok = false;
    }

    const std::string testOrigins = joinList(settings.allowedOrigins, ",");
    const std::string allOrigins = joinList(originsWithLocalhost(settings), ",");
    const std::vector<std::pair<std::filesystem::path, EnvUpdates>> envFiles = {
        {projectRoot_ / ".env",
         {{"FRONTEND_URL", settings.frontendUrl},
          {"BACKEND_URL", settings.backendUrl},
          {"ALLOWED_ORIGINS", testOrigins},
          {"ENABLE_CORS", "true"}}},
        {projectRoot_ / "frontend-manager" / ".env.local",
         {{"NEXT_PUBLIC_APP_URL", settings.frontendUrl},
          {"KRAPI_BACKEND_URL", settings.backendUrl},
          {"ALLOWED_ORIGINS", testOrigins}}},
        {projectRoot_ / "backend-server" / ".env",
         {{"FRONTEND_URL", settings.frontendUrl},
          {"KRAPI_FRONTEND_URL", settings.frontendUrl},
          {"ALLOWED_ORIGINS", allOrigins},
          {"ENABLE_CORS", "true"},
          {"DISABLE_RATE_LIMIT", "true"},
          {"LOGIN_RATE_LIMIT_MAX", std::to_string(UNLIMITED)},
          {"SENSITIVE_RATE_LIMIT_MAX", std::to_string(UNLIMITED)},
          {"RATE_LIMIT_MAX_REQUESTS", std::to_string(UNLIMITED)}}}};

    for (const auto &[path, updates] : envFiles) {
        try {
            updateEnvFile(path, updates);
        } catch (const std::exception &e) {
            LOG_WARN("Could not sync {}: {} (continuing anyway)", path.string(), e.what());
            ok = false;
        }
    }

    if (ok) {
        LOG_INFO("App configured for tests");
    }
    return ok;
}

}  // namespace TOE

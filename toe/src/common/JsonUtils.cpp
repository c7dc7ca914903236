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

#include "common/JsonUtils.h"
#include "common/Logger.h"
#include <fstream>
#include <sstream>

namespace TOE {

std::optional<json> JsonUtils::parseJson(const std::string &jsonString, std::string *errorOut) {
    try {
        return json::parse(jsonString);
    } catch (const json::parse_error &e) {
        if (errorOut) {
            *errorOut = e.what();
        }
        LOG_DEBUG("JsonUtils: Failed to parse JSON: {}", e.what());
        return std::nullopt;
    }
}

std::optional<json> JsonUtils::parseFile(const std::string &path, std::string *errorOut) {
    std::ifstream in(path);
    if (!in) {
        if (errorOut) {
            *errorOut = "cannot open " + path;
        }
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return parseJson(buffer.str(), errorOut);
}

std::string JsonUtils::toCompactString(const json &value) {
    return value.dump();
}

std::string JsonUtils::toPrettyString(const json &value) {
    return value.dump(2);
}

std::string JsonUtils::getString(const json &object, const std::string &key, const std::string &defaultValue) {
    if (!object.is_object() || !object.contains(key)) {
        return defaultValue;
    }

    const auto &value = object[key];
    if (!value.is_string()) {
        return defaultValue;
    }

    return value.get<std::string>();
}

int JsonUtils::getInt(const json &object, const std::string &key, int defaultValue) {
    if (!object.is_object() || !object.contains(key)) {
        return defaultValue;
    }

    const auto &value = object[key];
    if (!value.is_number_integer()) {
        return defaultValue;
    }

    return value.get<int>();
}

bool JsonUtils::hasKey(const json &object, const std::string &key) {
    return object.is_object() && object.contains(key) && !object[key].is_null();
}

std::string JsonUtils::findId(const json &payload) {
    if (!payload.is_object()) {
        return "";
    }
    if (hasKey(payload, "id")) {
        const auto &id = payload["id"];
        if (id.is_string()) {
            return id.get<std::string>();
        }
        if (id.is_number_integer()) {
            return std::to_string(id.get<long long>());
        }
    }
    if (hasKey(payload, "data")) {
        return findId(payload["data"]);
    }
    return "";
}

}  // namespace TOE

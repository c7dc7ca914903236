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

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace TOE {

using json = nlohmann::json;

/**
 * @brief Centralized JSON processing utilities using nlohmann/json
 *
 * Used for the structured run report, failure-history lookups and API payloads.
 */
class JsonUtils {
public:
    /**
     * @brief Parse JSON string into json object with error handling
     * @param jsonString Input JSON string
     * @param errorOut Optional error message output
     * @return Parsed json object or nullopt on failure
     */
    static std::optional<json> parseJson(const std::string &jsonString, std::string *errorOut = nullptr);

    /**
     * @brief Parse the JSON document stored in a file
     * @return Parsed json object or nullopt if unreadable or malformed
     */
    static std::optional<json> parseFile(const std::string &path, std::string *errorOut = nullptr);

    static std::string toCompactString(const json &value);

    static std::string toPrettyString(const json &value);

    /**
     * @brief Safely get string value from JSON object
     * @return String value or default when missing or not a string
     */
    static std::string getString(const json &object, const std::string &key, const std::string &defaultValue = "");

    /**
     * @brief Safely get integer value from JSON object
     * @return Integer value or default when missing or not an integer
     */
    static int getInt(const json &object, const std::string &key, int defaultValue = 0);

    /**
     * @brief Check if JSON object has key and it's not null
     */
    static bool hasKey(const json &object, const std::string &key);

    /**
     * @brief Resolve an identifier from an API payload
     *
     * Accepts both the bare form {"id": ...} and the enveloped form
     * {"data": {"id": ...}}. Numeric ids are rendered as decimal strings.
     *
     * @return Identifier or empty string when absent
     */
    static std::string findId(const json &payload);
};

}  // namespace TOE

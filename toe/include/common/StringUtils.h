// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-TOE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace TOE {

inline std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

inline std::string trim(const std::string &value) {
    size_t start = 0;
    while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start]))) {
        start++;
    }
    size_t end = value.size();
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        end--;
    }
    return value.substr(start, end - start);
}

/**
 * @brief Split on a delimiter, trimming each piece and dropping empty ones
 *
 * "auth, projects,,cors" -> {"auth", "projects", "cors"}
 */
inline std::vector<std::string> splitList(const std::string &value, char delimiter = ',') {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= value.size()) {
        size_t end = value.find(delimiter, start);
        if (end == std::string::npos) {
            end = value.size();
        }
        std::string piece = trim(value.substr(start, end - start));
        if (!piece.empty()) {
            parts.push_back(piece);
        }
        start = end + 1;
    }
    return parts;
}

inline std::string joinList(const std::vector<std::string> &parts, const std::string &separator = ", ") {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += parts[i];
    }
    return result;
}

inline bool containsIgnoreCase(const std::string &haystack, const std::string &needle) {
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

inline bool startsWith(const std::string &value, const std::string &prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

/**
 * @brief Keep at most maxLines lines of a multi-line text (stack traces, diagnostics)
 */
inline std::string truncateLines(const std::string &text, size_t maxLines) {
    size_t pos = 0;
    for (size_t line = 0; line < maxLines; ++line) {
        pos = text.find('\n', pos);
        if (pos == std::string::npos) {
            return text;
        }
        pos++;
    }
    return text.substr(0, pos > 0 ? pos - 1 : 0);
}

}  // namespace TOE

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

#include "common/Logger.h"
#include "backends/SpdlogBackend.h"

#include <cctype>
#include <mutex>

namespace TOE {

std::unique_ptr<ILoggerBackend> Logger::backend_;

// Guards backend creation and replacement
static std::recursive_mutex backend_mutex;

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard<std::recursive_mutex> lock(backend_mutex);
    backend_ = std::move(backend);
}

void Logger::initialize() {
    std::lock_guard<std::recursive_mutex> lock(backend_mutex);
    if (!backend_) {
        backend_ = std::make_unique<SpdlogBackend>();
    }
}

void Logger::initialize(const std::string &logDir, bool logToFile) {
    std::lock_guard<std::recursive_mutex> lock(backend_mutex);
    if (!backend_) {
        backend_ = std::make_unique<SpdlogBackend>(logDir, logToFile);
    }
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::recursive_mutex> lock(backend_mutex);
    ensureBackend();
    backend_->setLevel(level);
}

void Logger::trace(const std::string &message, const std::source_location &loc) {
    dispatch(LogLevel::Trace, message, loc);
}

void Logger::debug(const std::string &message, const std::source_location &loc) {
    dispatch(LogLevel::Debug, message, loc);
}

void Logger::info(const std::string &message, const std::source_location &loc) {
    dispatch(LogLevel::Info, message, loc);
}

void Logger::warn(const std::string &message, const std::source_location &loc) {
    dispatch(LogLevel::Warn, message, loc);
}

void Logger::error(const std::string &message, const std::source_location &loc) {
    dispatch(LogLevel::Error, message, loc);
}

void Logger::critical(const std::string &message, const std::source_location &loc) {
    dispatch(LogLevel::Critical, message, loc);
}

void Logger::flush() {
    std::lock_guard<std::recursive_mutex> lock(backend_mutex);
    ensureBackend();
    backend_->flush();
}

void Logger::reset() {
    std::lock_guard<std::recursive_mutex> lock(backend_mutex);
    backend_.reset();
}

void Logger::dispatch(LogLevel level, const std::string &message, const std::source_location &loc) {
    std::lock_guard<std::recursive_mutex> lock(backend_mutex);
    ensureBackend();
    backend_->log(level, extractCleanFunctionName(loc) + "() - " + message, loc);
}

void Logger::ensureBackend() {
    if (!backend_) {
        initialize();
    }
}

std::string Logger::extractCleanFunctionName(const std::source_location &loc) {
    std::string full_name = loc.function_name();

    size_t paren_pos = full_name.find('(');
    if (paren_pos == std::string::npos) {
        return "UnknownFunction";
    }

    size_t name_end = paren_pos;
    while (name_end > 0 && (std::isspace(static_cast<unsigned char>(full_name[name_end - 1])) ||
                            full_name[name_end - 1] == ')')) {
        name_end--;
    }

    // Last space outside template and parameter brackets separates return type from name
    size_t name_start = 0;
    size_t space_pos = std::string::npos;
    int angle_depth = 0;
    int paren_depth = 0;
    for (size_t i = 0; i < name_end; i++) {
        char c = full_name[i];
        if (c == '<') {
            angle_depth++;
        } else if (c == '>') {
            angle_depth--;
        } else if (c == '(') {
            paren_depth++;
        } else if (c == ')') {
            paren_depth--;
        } else if (c == ' ' && angle_depth == 0 && paren_depth == 0) {
            space_pos = i;
        }
    }
    if (space_pos != std::string::npos) {
        name_start = space_pos + 1;
    }

    std::string qualified = full_name.substr(name_start, name_end - name_start);
    while (!qualified.empty() &&
           (std::isspace(static_cast<unsigned char>(qualified[0])) || qualified[0] == '*' || qualified[0] == '&')) {
        qualified.erase(0, 1);
    }

    std::string result;
    int depth = 0;
    for (char c : qualified) {
        if (c == '<') {
            depth++;
        } else if (c == '>') {
            depth--;
        } else if (depth == 0) {
            result += c;
        }
    }

    while (!result.empty() && std::isspace(static_cast<unsigned char>(result.back()))) {
        result.pop_back();
    }

    return result.empty() ? "UnknownFunction" : result;
}

}  // namespace TOE

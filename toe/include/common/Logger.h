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

#include "common/ILoggerBackend.h"
#include <fmt/format.h>
#include <memory>
#include <source_location>
#include <string>

namespace TOE {

/**
 * @brief Centralized logging facade with dependency injection support
 *
 * Default backend is spdlog (console, optionally a file under the reports
 * directory). Tests and embedders may inject their own ILoggerBackend.
 *
 * @code
 * TOE::Logger::initialize();
 * LOG_INFO("Starting backend on port {}", 3470);
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Inject custom logger backend (ownership transferred)
     */
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /**
     * @brief Initialize default logger (stdout, no file)
     */
    static void initialize();

    /**
     * @brief Initialize default logger with file output
     *
     * @param logDir Directory for log files
     * @param logToFile Enable file logging
     */
    static void initialize(const std::string &logDir, bool logToFile = true);

    static void setLevel(LogLevel level);

    static void trace(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void debug(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void info(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void warn(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void error(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void critical(const std::string &message,
                         const std::source_location &loc = std::source_location::current());

    static void flush();

    /**
     * @brief Drop the current backend so the next call re-creates the default one
     */
    static void reset();

private:
    static std::unique_ptr<ILoggerBackend> backend_;
    static void ensureBackend();
    static void dispatch(LogLevel level, const std::string &message, const std::source_location &loc);
    static std::string extractCleanFunctionName(const std::source_location &loc);
};

}  // namespace TOE

#define LOG_TRACE(...) TOE::Logger::trace(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) TOE::Logger::debug(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...) TOE::Logger::info(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...) TOE::Logger::warn(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) TOE::Logger::error(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_CRITICAL(...) TOE::Logger::critical(fmt::format(__VA_ARGS__), std::source_location::current())

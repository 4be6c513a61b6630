// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-GAIA-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of GAIA (Adaptive Test Scheduler).
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
#include <format>
#include <memory>
#include <source_location>
#include <string>

namespace GAIA {

/**
 * @brief Process-wide diagnostic logging facade
 *
 * Diagnostic output only. The scheduler's audit trail (ingest/execute/rescore
 * records persisted to JSON) lives in PriorityLogger and never goes through here.
 *
 * 1. Default mode: spdlog backend when built with GAIA_USE_SPDLOG, DefaultBackend otherwise
 * 2. Custom mode: the host injects its own ILoggerBackend
 *
 * @code
 * GAIA::Logger::initialize("logs", true);
 * LOG_INFO("Scheduler ready, queue capacity {}", config.maxQueueSize);
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Replace the active backend (ownership transferred)
     */
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /**
     * @brief Create the default console backend if none is installed
     */
    static void initialize();

    /**
     * @brief Create the default backend with optional file output
     *
     * @param logDir Directory for gaia.log
     * @param logToFile Enable the file sink
     */
    static void initialize(const std::string &logDir, bool logToFile = true);

    static void setLevel(LogLevel level);

    static void trace(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void debug(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void info(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void warn(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void error(const std::string &message, const std::source_location &loc = std::source_location::current());

    static void flush();

private:
    static std::unique_ptr<ILoggerBackend> backend_;
    static void ensureBackend();
    static void write(LogLevel level, const std::string &message, const std::source_location &loc);
    static std::string callerName(const std::source_location &loc);
};

}  // namespace GAIA

#define LOG_TRACE(...) GAIA::Logger::trace(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) GAIA::Logger::debug(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...) GAIA::Logger::info(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...) GAIA::Logger::warn(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) GAIA::Logger::error(std::format(__VA_ARGS__), std::source_location::current())

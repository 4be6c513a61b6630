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

#include <source_location>
#include <string>

namespace GAIA {

/**
 * @brief Diagnostic log level
 *
 * Mirrors the spdlog level set so backends can map one-to-one.
 */
enum class LogLevel { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Critical = 5, Off = 6 };

/**
 * @brief Logger backend interface for dependency injection
 *
 * Hosts embedding the scheduler (desktop shell, agent service) can route the
 * scheduler's diagnostics into their own logging system by implementing this
 * interface and passing it to Logger::setBackend().
 *
 * Example: forwarding to a host logger
 * @code
 * class HostLogger : public GAIA::ILoggerBackend {
 * public:
 *     void log(LogLevel level, const std::string &message,
 *              const std::source_location &loc) override {
 *         host_->write(static_cast<int>(level), message, loc.file_name(), loc.line());
 *     }
 *     void setLevel(LogLevel level) override { host_->setMinLevel(static_cast<int>(level)); }
 *     void flush() override { host_->flush(); }
 * };
 * @endcode
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /**
     * @brief Log a message with source location
     *
     * @param level Log level
     * @param message Pre-formatted message (function name already included)
     * @param loc Source location (file, line, function)
     */
    virtual void log(LogLevel level, const std::string &message, const std::source_location &loc) = 0;

    /**
     * @brief Set minimum log level
     */
    virtual void setLevel(LogLevel level) = 0;

    /**
     * @brief Flush pending output
     */
    virtual void flush() = 0;
};

}  // namespace GAIA

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
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>
#include <string>

namespace GAIA {
namespace Log {

/**
 * @brief Sanitize string for safe logging (prevent log injection)
 *
 * Executor error messages and item ids come from remote collaborators.
 * - '\n' → "\\n"
 * - '\r' → "\\r"
 * - Other control chars → '?'
 * - Printable ASCII (32-126) → preserved as-is
 */
inline std::string sanitize(const std::string &input) {
    std::string sanitized;
    sanitized.reserve(input.length());

    for (char c : input) {
        if (c == '\n') {
            sanitized += "\\n";
        } else if (c == '\r') {
            sanitized += "\\r";
        } else if (c >= 32 && c < 127) {
            sanitized += c;
        } else {
            sanitized += '?';
        }
    }

    return sanitized;
}

/**
 * @brief Parse a spdlog-style level name ("trace", "warn", "err", ...)
 */
inline std::optional<LogLevel> parseLevel(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (name == "trace") {
        return LogLevel::Trace;
    } else if (name == "debug") {
        return LogLevel::Debug;
    } else if (name == "info") {
        return LogLevel::Info;
    } else if (name == "warn" || name == "warning") {
        return LogLevel::Warn;
    } else if (name == "err" || name == "error") {
        return LogLevel::Error;
    } else if (name == "critical") {
        return LogLevel::Critical;
    } else if (name == "off") {
        return LogLevel::Off;
    }
    return std::nullopt;
}

/**
 * @brief Level requested through the SPDLOG_LEVEL environment variable, if any
 */
inline std::optional<LogLevel> levelFromEnvironment() {
    const char *env_level = std::getenv("SPDLOG_LEVEL");
    if (!env_level) {
        return std::nullopt;
    }
    return parseLevel(env_level);
}

}  // namespace Log
}  // namespace GAIA

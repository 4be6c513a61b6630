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
#include <mutex>
#include <string>

namespace GAIA {

/**
 * @brief Dependency-free backend used when built with GAIA_USE_SPDLOG=OFF
 *
 * Writes timestamped, colored lines to stderr so that stdout stays free for
 * program output such as the run summary. No file output.
 */
class DefaultBackend : public ILoggerBackend {
public:
    DefaultBackend();

    void log(LogLevel level, const std::string &message, const std::source_location &loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    LogLevel threshold_;
    std::mutex mutex_;
};

}  // namespace GAIA

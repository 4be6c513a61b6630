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
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace GAIA {

/**
 * @brief spdlog-based logger backend
 *
 * Default backend when built with GAIA_USE_SPDLOG=ON. Colored stderr sink
 * always, plus a gaia.log file sink when a log directory is given. The level
 * starts at info unless SPDLOG_LEVEL says otherwise.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    SpdlogBackend(const std::string &logDir = "", bool logToFile = false);

    void log(LogLevel level, const std::string &message, const std::source_location &loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace GAIA

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

#include "common/Logger.h"

#ifdef GAIA_USE_SPDLOG
#include "backends/SpdlogBackend.h"
#else
#include "backends/DefaultBackend.h"
#endif

#include <mutex>
#include <string_view>

namespace GAIA {

std::unique_ptr<ILoggerBackend> Logger::backend_;

static std::mutex backend_mutex;

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard<std::mutex> lock(backend_mutex);
    backend_ = std::move(backend);
}

void Logger::initialize() {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (!backend_) {
#ifdef GAIA_USE_SPDLOG
        backend_ = std::make_unique<SpdlogBackend>();
#else
        backend_ = std::make_unique<DefaultBackend>();
#endif
    }
}

void Logger::initialize([[maybe_unused]] const std::string &logDir, [[maybe_unused]] bool logToFile) {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (!backend_) {
#ifdef GAIA_USE_SPDLOG
        backend_ = std::make_unique<SpdlogBackend>(logDir, logToFile);
#else
        // DefaultBackend has no file sink
        backend_ = std::make_unique<DefaultBackend>();
#endif
    }
}

void Logger::setLevel(LogLevel level) {
    ensureBackend();
    backend_->setLevel(level);
}

void Logger::trace(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Trace, message, loc);
}

void Logger::debug(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Debug, message, loc);
}

void Logger::info(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Info, message, loc);
}

void Logger::warn(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Warn, message, loc);
}

void Logger::error(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Error, message, loc);
}

void Logger::flush() {
    ensureBackend();
    backend_->flush();
}

void Logger::write(LogLevel level, const std::string &message, const std::source_location &loc) {
    ensureBackend();
    backend_->log(level, callerName(loc) + "() - " + message, loc);
}

void Logger::ensureBackend() {
    if (!backend_) {
        initialize();
    }
}

std::string Logger::callerName(const std::source_location &loc) {
    // e.g. "void GAIA::AdaptiveScheduler::clear()" or
    //      "std::vector<GAIA::TestItem> GAIA::AdaptivePriorityQueue::getTopN(size_t) const"
    std::string_view signature = loc.function_name();
    signature = signature.substr(0, signature.find('('));

    // Drop template arguments so their spaces and scopes do not confuse the split below
    std::string name;
    int depth = 0;
    for (char c : signature) {
        if (c == '<') {
            ++depth;
        } else if (c == '>') {
            --depth;
        } else if (depth == 0) {
            name += c;
        }
    }

    // Return type and qualifiers precede the last space
    auto space = name.find_last_of(" *&");
    if (space != std::string::npos) {
        name.erase(0, space + 1);
    }

    // Keep only Class::method
    auto last = name.rfind("::");
    if (last != std::string::npos && last > 0) {
        auto previous = name.rfind("::", last - 1);
        if (previous != std::string::npos) {
            name.erase(0, previous + 2);
        }
    }

    return name.empty() ? "UnknownFunction" : name;
}

}  // namespace GAIA

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

#include "backends/SpdlogBackend.h"
#include "common/LogUtils.h"
#include <filesystem>
#include <system_error>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace GAIA {

namespace {
constexpr const char *LOGGER_NAME = "GAIA";
constexpr const char *CONSOLE_PATTERN = "[%H:%M:%S.%e] [%^%l%$] %v";
constexpr const char *FILE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";

// LogLevel mirrors spdlog's level ordering (trace .. off)
spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
    auto value = static_cast<int>(level);
    if (value < static_cast<int>(spdlog::level::trace) || value > static_cast<int>(spdlog::level::off)) {
        return spdlog::level::info;
    }
    return static_cast<spdlog::level::level_enum>(value);
}
}  // namespace

SpdlogBackend::SpdlogBackend(const std::string &logDir, bool logToFile) {
    // A previous backend may have registered the name already
    spdlog::drop(LOGGER_NAME);

    // Console output goes to stderr; stdout carries the run summary
    std::vector<spdlog::sink_ptr> sinks;
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern(CONSOLE_PATTERN);
    sinks.push_back(console_sink);

    std::error_code dirError;
    if (logToFile && !logDir.empty()) {
        std::filesystem::create_directories(logDir, dirError);
        if (!dirError) {
            std::filesystem::path logPath = std::filesystem::path(logDir) / "gaia.log";
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logPath.string(), true);
            file_sink->set_pattern(FILE_PATTERN);
            sinks.push_back(file_sink);
        }
    }

    logger_ = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    spdlog::register_logger(logger_);

    logger_->set_level(toSpdlogLevel(Log::levelFromEnvironment().value_or(LogLevel::Info)));

    if (dirError) {
        logger_->warn("Cannot create log directory {}, logging to console only: {}", logDir, dirError.message());
    }
}

void SpdlogBackend::log(LogLevel level, const std::string &message, [[maybe_unused]] const std::source_location &loc) {
    if (logger_) {
        logger_->log(toSpdlogLevel(level), message);
    }
}

void SpdlogBackend::setLevel(LogLevel level) {
    if (logger_) {
        logger_->set_level(toSpdlogLevel(level));
    }
}

void SpdlogBackend::flush() {
    if (logger_) {
        logger_->flush();
    }
}

}  // namespace GAIA

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

#include "backends/DefaultBackend.h"
#include "common/LogUtils.h"
#include <array>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <format>

namespace GAIA {

namespace {
struct LevelStyle {
    const char *label;
    const char *color;
};

constexpr const char *COLOR_RESET = "\033[0m";

// Indexed by LogLevel
constexpr std::array<LevelStyle, 7> LEVEL_STYLES{{{"trace", "\033[37m"},
                                                  {"debug", "\033[36m"},
                                                  {"info", "\033[32m"},
                                                  {"warn", "\033[33m"},
                                                  {"error", "\033[31m"},
                                                  {"critical", "\033[35m"},
                                                  {"off", "\033[0m"}}};

const LevelStyle &styleFor(LogLevel level) {
    auto index = static_cast<size_t>(level);
    return LEVEL_STYLES[index < LEVEL_STYLES.size() ? index : static_cast<size_t>(LogLevel::Info)];
}

std::string wallClock() {
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&now_time_t, &tm_buf);

    return std::format("{:02d}:{:02d}:{:02d}.{:03d}", tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                       static_cast<int>(now_ms.count()));
}
}  // namespace

DefaultBackend::DefaultBackend() : threshold_(Log::levelFromEnvironment().value_or(LogLevel::Info)) {}

void DefaultBackend::log(LogLevel level, const std::string &message, [[maybe_unused]] const std::source_location &loc) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < threshold_ || threshold_ == LogLevel::Off) {
        return;
    }

    const LevelStyle &style = styleFor(level);
    std::string line = std::format("[{}] [{}{}{}] {}\n", wallClock(), style.color, style.label, COLOR_RESET, message);
    std::fputs(line.c_str(), stderr);
}

void DefaultBackend::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    threshold_ = level;
}

void DefaultBackend::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(stderr);
}

}  // namespace GAIA

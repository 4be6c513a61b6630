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

#include "common/JsonUtils.h"
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace GAIA {

/**
 * @brief AdaptiveScheduler tunables
 *
 * JSON keys (all optional):
 * @code
 * {
 *   "max_queue_size": 100,
 *   "top_n_execution": 5,
 *   "log_file": "priority_log.json",
 *   "max_rounds": 20,
 *   "completion_threshold": 0.9,
 *   "executor_timeout_ms": 0
 * }
 * @endcode
 */
struct SchedulerConfig {
    size_t maxQueueSize = 100;
    size_t topNExecution = 5;
    std::string logFile = "priority_log.json";
    int maxRounds = 20;
    double completionThreshold = 0.9;
    std::chrono::milliseconds executorTimeout{0};  // 0 disables the timeout wrapper

    /**
     * @brief Throw std::invalid_argument on values the scheduler cannot run with
     */
    void validate() const;

    /**
     * @brief Overlay keys present in object onto the defaults
     *
     * Missing keys, keys of the wrong JSON type and negative integers keep
     * their default. Zero sizes and an out-of-range completion_threshold are
     * taken as given and left for validate() to reject.
     */
    static SchedulerConfig fromJson(const json &object);

    /**
     * @brief Load from a JSON file
     * @return nullopt when the file is unreadable, malformed, or fails validate()
     */
    static std::optional<SchedulerConfig> loadFromFile(const std::string &path, std::string *errorOut = nullptr);

    json toJson() const;
};

}  // namespace GAIA

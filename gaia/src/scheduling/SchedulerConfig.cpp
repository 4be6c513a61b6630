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

#include "scheduling/SchedulerConfig.h"
#include "common/LogUtils.h"
#include "common/Logger.h"
#include <algorithm>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace GAIA {

void SchedulerConfig::validate() const {
    if (maxQueueSize == 0) {
        throw std::invalid_argument("SchedulerConfig: max_queue_size must be positive");
    }
    if (topNExecution == 0) {
        throw std::invalid_argument("SchedulerConfig: top_n_execution must be positive");
    }
    if (maxRounds <= 0) {
        throw std::invalid_argument("SchedulerConfig: max_rounds must be positive");
    }
    if (completionThreshold < 0.0 || completionThreshold > 1.0) {
        throw std::invalid_argument("SchedulerConfig: completion_threshold must be within [0, 1]");
    }
    if (executorTimeout.count() < 0) {
        throw std::invalid_argument("SchedulerConfig: executor_timeout_ms must not be negative");
    }
}

namespace {
// Present integer value that is not negative; negatives are ignored with a warning
std::optional<int64_t> nonNegativeInt(const json &object, const char *key) {
    if (!object.is_object() || !object.contains(key) || !object[key].is_number_integer()) {
        return std::nullopt;
    }

    int64_t value = JsonUtils::getInt64(object, key);
    if (value < 0) {
        LOG_WARN("SchedulerConfig: Negative {} ({}) ignored, keeping default", key, value);
        return std::nullopt;
    }
    return value;
}
}  // namespace

SchedulerConfig SchedulerConfig::fromJson(const json &object) {
    SchedulerConfig config;

    if (auto maxQueueSize = nonNegativeInt(object, "max_queue_size")) {
        config.maxQueueSize = static_cast<size_t>(*maxQueueSize);
    }
    if (auto topN = nonNegativeInt(object, "top_n_execution")) {
        config.topNExecution = static_cast<size_t>(*topN);
    }

    config.logFile = JsonUtils::getString(object, "log_file", config.logFile);

    if (auto maxRounds = nonNegativeInt(object, "max_rounds")) {
        config.maxRounds = static_cast<int>(std::min<int64_t>(*maxRounds, std::numeric_limits<int>::max()));
    }

    config.completionThreshold = JsonUtils::getDouble(object, "completion_threshold", config.completionThreshold);

    if (auto timeoutMs = nonNegativeInt(object, "executor_timeout_ms")) {
        config.executorTimeout = std::chrono::milliseconds(*timeoutMs);
    }

    return config;
}

std::optional<SchedulerConfig> SchedulerConfig::loadFromFile(const std::string &path, std::string *errorOut) {
    std::string error;
    auto document = JsonUtils::loadFile(path, &error);
    if (!document) {
        LOG_WARN("SchedulerConfig: Cannot load '{}': {}", Log::sanitize(path), Log::sanitize(error));
        if (errorOut) {
            *errorOut = error;
        }
        return std::nullopt;
    }

    if (!document->is_object()) {
        error = "Config root must be a JSON object";
        LOG_WARN("SchedulerConfig: Cannot load '{}': {}", Log::sanitize(path), Log::sanitize(error));
        if (errorOut) {
            *errorOut = error;
        }
        return std::nullopt;
    }

    SchedulerConfig config = fromJson(*document);
    try {
        config.validate();
    } catch (const std::invalid_argument &e) {
        LOG_WARN("SchedulerConfig: Rejecting '{}': {}", Log::sanitize(path), e.what());
        if (errorOut) {
            *errorOut = e.what();
        }
        return std::nullopt;
    }

    LOG_INFO("SchedulerConfig: Loaded '{}' (queue {}, batch {}, rounds {}, threshold {})", Log::sanitize(path),
             config.maxQueueSize, config.topNExecution, config.maxRounds, config.completionThreshold);
    return config;
}

json SchedulerConfig::toJson() const {
    return json{{"max_queue_size", maxQueueSize},
                {"top_n_execution", topNExecution},
                {"log_file", logFile},
                {"max_rounds", maxRounds},
                {"completion_threshold", completionThreshold},
                {"executor_timeout_ms", executorTimeout.count()}};
}

}  // namespace GAIA

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
#include "model/TestItem.h"
#include "scheduling/GAIAState.h"
#include "scheduling/Scoring.h"
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace GAIA {

namespace LogAction {
constexpr const char *SCORED = "scored";
constexpr const char *INGESTED = "ingested";
constexpr const char *EXECUTED = "executed";
constexpr const char *RESCORE = "rescore";
}  // namespace LogAction

/**
 * @brief One audit record
 *
 * Score entries (any action other than executed/rescore) carry the breakdown.
 * Executed entries add result and details. Rescore entries carry reason and
 * the state counters instead of an item.
 */
struct LogEntry {
    std::string action;
    std::string itemId;
    std::string priority;
    std::optional<ScoreBreakdown> breakdown;

    std::string result;
    json details;  // null when absent

    std::string reason;
    std::optional<StateStats> stateSummary;

    std::string timestamp;
    int executionRound = 0;

    json toJson() const;
};

/**
 * @brief Aggregates derived from the audit log
 */
struct LogSummary {
    size_t totalEntries = 0;
    size_t executedTests = 0;
    size_t successCount = 0;
    size_t failedCount = 0;
    size_t rescoreEvents = 0;
    std::map<std::string, double> averageScoresByPriority;

    json toJson() const;
};

/**
 * @brief Append-only audit log of scheduling decisions
 *
 * Every entry recomputes the score breakdown against the state passed at
 * logging time, so an executed entry shows the score as it stands after the
 * outcome was applied (e.g. with the retry bonus), not the push-time score.
 */
class PriorityLogger {
public:
    static constexpr const char *DEFAULT_LOG_FILE = "priority_log.json";

    explicit PriorityLogger(std::string logFile = DEFAULT_LOG_FILE);

    void logScore(const TestItem &item, const GAIAState &state, const std::string &action = LogAction::SCORED);

    /**
     * @brief Record an execution outcome
     *
     * @param result Outcome label ("success", "failed", or the executor's status)
     * @param details Executor result payload; null or empty objects are omitted
     */
    void logExecution(const TestItem &item, const GAIAState &state, const std::string &result,
                      const json &details = nullptr);

    void logRescore(const GAIAState &state, const std::string &reason);

    /**
     * @brief Write all entries to the log file as a JSON array
     * @return false if the file could not be written (reported via LOG_ERROR)
     */
    bool save() const;

    const std::vector<LogEntry> &getEntries() const {
        return entries_;
    }

    json toJson() const;

    /**
     * @brief Recompute aggregates from the current entries
     */
    LogSummary getSummary() const;

    size_t size() const {
        return entries_.size();
    }

    const std::string &logFile() const {
        return logFile_;
    }

    void clear();

private:
    std::string logFile_;
    std::vector<LogEntry> entries_;
};

}  // namespace GAIA

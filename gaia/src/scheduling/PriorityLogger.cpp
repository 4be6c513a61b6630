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

#include "scheduling/PriorityLogger.h"
#include "common/LogUtils.h"
#include "common/Logger.h"
#include "model/ExecutionResult.h"
#include <utility>

namespace GAIA {

json LogEntry::toJson() const {
    json object = json::object();

    if (action != LogAction::RESCORE) {
        object["id"] = itemId;
    }
    object["action"] = action;

    if (action == LogAction::EXECUTED) {
        object["result"] = result;
    }

    if (breakdown) {
        object["score"] = breakdown->totalScore;
        object["priority"] = priority;
        object["base_score"] = breakdown->baseScore;
        object["dom_bonus"] = breakdown->domBonus;
        object["url_bonus"] = breakdown->urlBonus;
        object["fail_bonus"] = breakdown->failBonus;
        object["no_change_penalty"] = breakdown->noChangePenalty;
        object["new_elements_count"] = breakdown->newElementsCount;
    }

    if (action == LogAction::RESCORE) {
        object["reason"] = reason;
    }

    object["timestamp"] = timestamp;
    object["execution_round"] = executionRound;

    if (!details.is_null()) {
        object["details"] = details;
    }

    if (stateSummary) {
        object["state_summary"] = json{{"visited_urls", stateSummary->visitedUrls},
                                       {"visited_doms", stateSummary->visitedDoms},
                                       {"failed_tests", stateSummary->failedTests},
                                       {"completed_tests", stateSummary->completedTests}};
    }

    return object;
}

json LogSummary::toJson() const {
    json averages = json::object();
    for (const auto &[priority, average] : averageScoresByPriority) {
        averages[priority] = average;
    }

    return json{{"total_entries", totalEntries}, {"executed_tests", executedTests},
                {"success_count", successCount}, {"failed_count", failedCount},
                {"rescore_events", rescoreEvents}, {"average_scores_by_priority", averages}};
}

PriorityLogger::PriorityLogger(std::string logFile) : logFile_(std::move(logFile)) {}

void PriorityLogger::logScore(const TestItem &item, const GAIAState &state, const std::string &action) {
    LogEntry entry;
    entry.action = action;
    entry.itemId = item.id;
    entry.priority = item.priorityLabel();
    entry.breakdown = computeScoreBreakdown(item, state);
    entry.timestamp = JsonUtils::utcTimestamp();
    entry.executionRound = state.getExecutionRound();

    entries_.push_back(std::move(entry));
}

void PriorityLogger::logExecution(const TestItem &item, const GAIAState &state, const std::string &result,
                                  const json &details) {
    LogEntry entry;
    entry.action = LogAction::EXECUTED;
    entry.itemId = item.id;
    entry.priority = item.priorityLabel();
    entry.breakdown = computeScoreBreakdown(item, state);
    entry.result = result;
    if (!details.is_null() && !details.empty()) {
        entry.details = details;
    }
    entry.timestamp = JsonUtils::utcTimestamp();
    entry.executionRound = state.getExecutionRound();

    entries_.push_back(std::move(entry));
}

void PriorityLogger::logRescore(const GAIAState &state, const std::string &reason) {
    LogEntry entry;
    entry.action = LogAction::RESCORE;
    entry.reason = reason;
    entry.stateSummary = state.getStats();
    entry.timestamp = JsonUtils::utcTimestamp();
    entry.executionRound = state.getExecutionRound();

    entries_.push_back(std::move(entry));
}

json PriorityLogger::toJson() const {
    json array = json::array();
    for (const auto &entry : entries_) {
        array.push_back(entry.toJson());
    }
    return array;
}

bool PriorityLogger::save() const {
    std::string error;
    if (!JsonUtils::writeFile(logFile_, toJson(), &error)) {
        LOG_ERROR("PriorityLogger: Failed to save {} entries to '{}': {}", entries_.size(), Log::sanitize(logFile_),
                  Log::sanitize(error));
        return false;
    }

    LOG_DEBUG("PriorityLogger: Saved {} entries to '{}'", entries_.size(), Log::sanitize(logFile_));
    return true;
}

LogSummary PriorityLogger::getSummary() const {
    LogSummary summary;
    summary.totalEntries = entries_.size();

    std::map<std::string, std::pair<long long, size_t>> scoreTotals;

    for (const auto &entry : entries_) {
        if (entry.action == LogAction::EXECUTED) {
            ++summary.executedTests;
            if (entry.result == ExecutionStatus::SUCCESS) {
                ++summary.successCount;
            } else if (entry.result == ExecutionStatus::FAILED) {
                ++summary.failedCount;
            }
        } else if (entry.action == LogAction::RESCORE) {
            ++summary.rescoreEvents;
        }

        if (entry.breakdown) {
            auto &[total, count] = scoreTotals[entry.priority];
            total += entry.breakdown->totalScore;
            ++count;
        }
    }

    for (const auto &[priority, totals] : scoreTotals) {
        summary.averageScoresByPriority[priority] =
            static_cast<double>(totals.first) / static_cast<double>(totals.second);
    }

    return summary;
}

void PriorityLogger::clear() {
    entries_.clear();
}

}  // namespace GAIA

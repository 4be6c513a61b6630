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
#include "model/ExecutionResult.h"
#include "model/TestItem.h"
#include "scheduling/AdaptivePriorityQueue.h"
#include "scheduling/GAIAState.h"
#include "scheduling/PriorityLogger.h"
#include "scheduling/SchedulerConfig.h"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace GAIA {

/**
 * @brief Coarse scheduler lifecycle, for observers and diagnostics
 */
enum class SchedulerPhase { Idle, Ingesting, Executing, Rescoring, Done };

const char *schedulerPhaseToString(SchedulerPhase phase);

struct ExecutionStats {
    size_t totalReceived = 0;
    size_t totalExecuted = 0;
    size_t totalSuccess = 0;
    size_t totalFailed = 0;
    size_t totalSkipped = 0;  // Executor returned a status other than success/failed
    size_t rescoreCount = 0;

    json toJson() const;
};

/**
 * @brief Report handed to report-generation collaborators at the end of a run
 */
struct SchedulerSummary {
    ExecutionStats executionStats;
    StateStats stateSummary;
    size_t remainingItems = 0;
    std::vector<TestItem> topPending;
    LogSummary logSummary;

    json toJson() const;
};

/**
 * @brief Adaptive test scheduler
 *
 * Pops the best-scored items in batches, hands each to the executor, feeds the
 * outcome back into GAIAState, and rescores the queue whenever an execution
 * lands on a DOM structure not seen before. Failed items are re-queued with a
 * retry bonus unless the result is fatal.
 *
 * Strictly sequential: one item at a time, because whether the next item's
 * priority changed depends on observing the previous item's effect.
 *
 * Example:
 * @code
 * GAIA::AdaptiveScheduler scheduler(config);
 * scheduler.ingestItems(items);
 * auto summary = scheduler.executeUntilComplete(executor);
 * @endcode
 */
class AdaptiveScheduler {
public:
    static constexpr size_t DEFAULT_TOP_PENDING = 5;

    /**
     * @throws std::invalid_argument if config fails SchedulerConfig::validate()
     */
    explicit AdaptiveScheduler(SchedulerConfig config = SchedulerConfig());

    /**
     * @brief Queue items from an upstream producer
     *
     * Items without an id or a priority are dropped without error.
     * @return Number of items accepted
     */
    size_t ingestItems(const std::vector<TestItem> &items);

    /**
     * @brief Queue items from a JSON array of maps
     *
     * Non-array input and entries rejected by TestItem::fromJson are dropped.
     */
    size_t ingestItems(const json &items);

    /**
     * @brief Execute up to maxItems of the highest-priority items
     *
     * @param maxItems Defaults to config.topNExecution
     * @return One result per executed item, in execution order
     */
    std::vector<ExecutionResult> executeNextBatch(const ExecutorCallback &executor,
                                                  std::optional<size_t> maxItems = std::nullopt);

    /**
     * @brief Run batches until the queue drains, the MUST completion threshold
     *        is reached, a batch executes nothing, or maxRounds elapse
     *
     * Saves the audit log before returning. Never throws on executor failure.
     */
    SchedulerSummary executeUntilComplete(const ExecutorCallback &executor, std::optional<int> maxRounds = std::nullopt,
                                          std::optional<double> completionThreshold = std::nullopt);

    SchedulerSummary generateSummary() const;

    /**
     * @brief Reset state, queue, audit log and statistics
     */
    void clear();

    const GAIAState &getState() const {
        return state_;
    }

    const AdaptivePriorityQueue &getQueue() const {
        return queue_;
    }

    const PriorityLogger &getLogger() const {
        return logger_;
    }

    const ExecutionStats &getStats() const {
        return stats_;
    }

    const SchedulerConfig &getConfig() const {
        return config_;
    }

    SchedulerPhase getPhase() const {
        return phase_;
    }

private:
    /**
     * @brief Outcome of one executed item as seen by the batch loop
     */
    struct ItemOutcome {
        ExecutionResult result;
        bool domWasNew = false;  // Signature unseen before this item recorded it
    };

    ItemOutcome executeItem(const TestItem &item, const ExecutorCallback &executor);
    void recordObservations(const TestItem &item, const ExecutionResult &result, bool &domWasNew);
    void handleDomChange(const std::string &newDomSignature, bool domWasNew);
    bool checkCompletionThreshold(double threshold) const;
    void setPhase(SchedulerPhase phase);

    SchedulerConfig config_;
    GAIAState state_;
    AdaptivePriorityQueue queue_;
    PriorityLogger logger_;
    ExecutionStats stats_;
    SchedulerPhase phase_ = SchedulerPhase::Idle;
};

}  // namespace GAIA

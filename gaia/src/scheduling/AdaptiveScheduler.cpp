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

#include "scheduling/AdaptiveScheduler.h"
#include "common/LogUtils.h"
#include "common/Logger.h"
#include "runtime/TimeoutExecutor.h"
#include <exception>
#include <utility>

namespace GAIA {

namespace {
constexpr const char *RESCORE_REASON_DOM_CHANGE = "dom_change";

SchedulerConfig validatedConfig(SchedulerConfig config) {
    config.validate();
    return config;
}
}  // namespace

const char *schedulerPhaseToString(SchedulerPhase phase) {
    switch (phase) {
    case SchedulerPhase::Idle:
        return "IDLE";
    case SchedulerPhase::Ingesting:
        return "INGESTING";
    case SchedulerPhase::Executing:
        return "EXECUTING";
    case SchedulerPhase::Rescoring:
        return "RESCORING";
    case SchedulerPhase::Done:
        return "DONE";
    default:
        return "UNKNOWN";
    }
}

json ExecutionStats::toJson() const {
    return json{{"total_received", totalReceived}, {"total_executed", totalExecuted},
                {"total_success", totalSuccess},   {"total_failed", totalFailed},
                {"total_skipped", totalSkipped},   {"rescore_count", rescoreCount}};
}

json SchedulerSummary::toJson() const {
    json pending = json::array();
    for (const auto &item : topPending) {
        pending.push_back(item.toJson());
    }

    return json{{"execution_stats", executionStats.toJson()},
                {"state_summary",
                 {{"visited_urls", stateSummary.visitedUrls},
                  {"visited_dom_signatures", stateSummary.visitedDoms},
                  {"completed_tests", stateSummary.completedTests},
                  {"failed_tests", stateSummary.failedTests},
                  {"execution_rounds", stateSummary.executionRound}}},
                {"queue_summary", {{"remaining_items", remainingItems}, {"top_pending", pending}}},
                {"log_summary", logSummary.toJson()}};
}

AdaptiveScheduler::AdaptiveScheduler(SchedulerConfig config)
    : config_(validatedConfig(std::move(config))), queue_(config_.maxQueueSize), logger_(config_.logFile) {
    LOG_DEBUG("AdaptiveScheduler: Created (queue capacity {}, batch size {}, log '{}')", config_.maxQueueSize,
              config_.topNExecution, Log::sanitize(config_.logFile));
}

size_t AdaptiveScheduler::ingestItems(const std::vector<TestItem> &items) {
    setPhase(SchedulerPhase::Ingesting);

    size_t accepted = 0;
    for (const auto &item : items) {
        if (item.id.empty() || item.priority.empty()) {
            LOG_DEBUG("AdaptiveScheduler: Dropping item without id/priority (id='{}')", Log::sanitize(item.id));
            continue;
        }

        queue_.push(item, state_);
        logger_.logScore(item, state_, LogAction::INGESTED);
        ++stats_.totalReceived;
        ++accepted;
    }

    LOG_INFO("AdaptiveScheduler: Ingested {}/{} items, queue size {}", accepted, items.size(), queue_.size());
    setPhase(queue_.empty() ? SchedulerPhase::Idle : SchedulerPhase::Ingesting);
    return accepted;
}

size_t AdaptiveScheduler::ingestItems(const json &items) {
    if (!items.is_array()) {
        LOG_DEBUG("AdaptiveScheduler: Ignoring non-array ingestion input");
        return 0;
    }

    std::vector<TestItem> parsed;
    parsed.reserve(items.size());
    for (const auto &object : items) {
        if (auto item = TestItem::fromJson(object)) {
            parsed.push_back(std::move(*item));
        }
    }

    if (parsed.size() < items.size()) {
        LOG_DEBUG("AdaptiveScheduler: {} malformed items dropped before ingestion", items.size() - parsed.size());
    }
    return ingestItems(parsed);
}

std::vector<ExecutionResult> AdaptiveScheduler::executeNextBatch(const ExecutorCallback &executor,
                                                                 std::optional<size_t> maxItems) {
    std::vector<ExecutionResult> results;
    if (!executor) {
        LOG_ERROR("AdaptiveScheduler: No executor supplied, batch skipped");
        return results;
    }

    ExecutorCallback effectiveExecutor = executor;
    if (config_.executorTimeout.count() > 0) {
        effectiveExecutor = TimeoutExecutor(executor, config_.executorTimeout);
    }

    const size_t limit = maxItems.value_or(config_.topNExecution);
    setPhase(SchedulerPhase::Executing);
    LOG_DEBUG("AdaptiveScheduler: Round {} batch of up to {} items (queue size {})", state_.getExecutionRound(), limit,
              queue_.size());

    // Only a change relative to the batch baseline triggers rescoring
    std::optional<std::string> baselineDom = state_.getCurrentDomSignature();

    for (size_t i = 0; i < limit; ++i) {
        auto item = queue_.pop();
        if (!item) {
            break;
        }

        ItemOutcome outcome = executeItem(*item, effectiveExecutor);

        const auto &newDom = outcome.result.domSignature;
        if (newDom && !newDom->empty() && newDom != baselineDom) {
            handleDomChange(*newDom, outcome.domWasNew);
            baselineDom = newDom;
        }

        results.push_back(std::move(outcome.result));
    }

    setPhase(queue_.empty() ? SchedulerPhase::Idle : SchedulerPhase::Executing);
    return results;
}

SchedulerSummary AdaptiveScheduler::executeUntilComplete(const ExecutorCallback &executor,
                                                         std::optional<int> maxRounds,
                                                         std::optional<double> completionThreshold) {
    const int rounds = maxRounds.value_or(config_.maxRounds);
    const double threshold = completionThreshold.value_or(config_.completionThreshold);

    std::string stopReason = "max_rounds";
    for (int round = 1; round <= rounds; ++round) {
        state_.incrementRound();

        if (queue_.empty()) {
            stopReason = "queue_empty";
            break;
        }

        if (checkCompletionThreshold(threshold)) {
            stopReason = "completion_threshold";
            break;
        }

        auto results = executeNextBatch(executor);
        if (results.empty()) {
            stopReason = "no_progress";
            break;
        }
    }

    setPhase(SchedulerPhase::Done);
    LOG_INFO("AdaptiveScheduler: Stopped after round {} ({}): executed {}, success {}, failed {}, rescores {}",
             state_.getExecutionRound(), stopReason, stats_.totalExecuted, stats_.totalSuccess, stats_.totalFailed,
             stats_.rescoreCount);

    // A failed save is reported by the logger; the run's summary is still returned
    (void)logger_.save();
    return generateSummary();
}

AdaptiveScheduler::ItemOutcome AdaptiveScheduler::executeItem(const TestItem &item, const ExecutorCallback &executor) {
    ++stats_.totalExecuted;

    ItemOutcome outcome;
    std::optional<std::string> exceptionMessage;
    try {
        outcome.result = executor(item);
    } catch (const std::exception &e) {
        exceptionMessage = e.what();
    } catch (...) {
        exceptionMessage = "unknown executor error";
    }

    if (exceptionMessage) {
        // Unexpected errors are not assumed transient: no retry
        LOG_WARN("AdaptiveScheduler: Executor threw for '{}': {}", Log::sanitize(item.id),
                 Log::sanitize(*exceptionMessage));

        state_.markTestFailed(item.id);
        ++stats_.totalFailed;

        outcome.result = ExecutionResult::failure(*exceptionMessage);
        outcome.result.extra["item_id"] = item.id;
        logger_.logExecution(item, state_, ExecutionStatus::FAILED, outcome.result.toJson());
        return outcome;
    }

    const ExecutionResult &result = outcome.result;
    if (result.isSuccess()) {
        state_.markTestCompleted(item.id);
        ++stats_.totalSuccess;
        logger_.logExecution(item, state_, ExecutionStatus::SUCCESS, result.toJson());
        LOG_DEBUG("AdaptiveScheduler: '{}' succeeded", Log::sanitize(item.id));
    } else if (result.isFailure()) {
        state_.markTestFailed(item.id);
        ++stats_.totalFailed;
        logger_.logExecution(item, state_, ExecutionStatus::FAILED, result.toJson());

        if (!result.fatal) {
            queue_.push(item, state_);
            LOG_DEBUG("AdaptiveScheduler: '{}' failed, re-queued for retry", Log::sanitize(item.id));
        } else {
            LOG_INFO("AdaptiveScheduler: '{}' failed fatally, abandoned: {}", Log::sanitize(item.id),
                     Log::sanitize(result.error.value_or("")));
        }
    } else {
        ++stats_.totalSkipped;
        logger_.logExecution(item, state_, result.status, result.toJson());
        LOG_WARN("AdaptiveScheduler: '{}' returned unrecognized status '{}', not retried", Log::sanitize(item.id),
                 Log::sanitize(result.status));
    }

    recordObservations(item, result, outcome.domWasNew);
    return outcome;
}

void AdaptiveScheduler::recordObservations(const TestItem &item, const ExecutionResult &result, bool &domWasNew) {
    if (item.targetUrl && !item.targetUrl->empty()) {
        state_.markUrlVisited(*item.targetUrl);
    } else if (result.currentUrl) {
        state_.markUrlVisited(*result.currentUrl);
    }

    if (result.domSignature && !result.domSignature->empty()) {
        domWasNew = state_.isDomNew(*result.domSignature);
        state_.markDomSeen(*result.domSignature);
    }
}

void AdaptiveScheduler::handleDomChange(const std::string &newDomSignature, bool domWasNew) {
    if (!domWasNew) {
        LOG_TRACE("AdaptiveScheduler: Returned to known DOM {}, no rescore", Log::sanitize(newDomSignature));
        return;
    }

    setPhase(SchedulerPhase::Rescoring);
    queue_.rescoreAll(state_);
    logger_.logRescore(state_, RESCORE_REASON_DOM_CHANGE);
    ++stats_.rescoreCount;
    LOG_DEBUG("AdaptiveScheduler: New DOM {} triggered rescore #{}", Log::sanitize(newDomSignature),
              stats_.rescoreCount);
    setPhase(SchedulerPhase::Executing);
}

bool AdaptiveScheduler::checkCompletionThreshold(double threshold) const {
    size_t queuedMust = 0;
    for (const auto &item : queue_.getTopN(queue_.size())) {
        if (parsePriority(item.priority) == Priority::Must) {
            ++queuedMust;
        }
    }

    // Completed items' original priority is not retained; all are counted as MUST
    const size_t completed = state_.getCompletedTestIds().size();
    const size_t totalMust = queuedMust + completed;
    if (totalMust == 0) {
        return true;
    }

    return static_cast<double>(completed) / static_cast<double>(totalMust) >= threshold;
}

SchedulerSummary AdaptiveScheduler::generateSummary() const {
    SchedulerSummary summary;
    summary.executionStats = stats_;
    summary.stateSummary = state_.getStats();
    summary.remainingItems = queue_.size();
    summary.topPending = queue_.getTopN(DEFAULT_TOP_PENDING);
    summary.logSummary = logger_.getSummary();
    return summary;
}

void AdaptiveScheduler::clear() {
    state_.reset();
    queue_.clear();
    logger_.clear();
    stats_ = ExecutionStats();
    setPhase(SchedulerPhase::Idle);
}

void AdaptiveScheduler::setPhase(SchedulerPhase phase) {
    if (phase_ != phase) {
        LOG_TRACE("AdaptiveScheduler: {} -> {}", schedulerPhaseToString(phase_), schedulerPhaseToString(phase));
        phase_ = phase;
    }
}

}  // namespace GAIA

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
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_set>

namespace GAIA {

/**
 * @brief Counters derived from GAIAState
 */
struct StateStats {
    size_t visitedUrls = 0;
    size_t visitedDoms = 0;
    size_t failedTests = 0;
    size_t completedTests = 0;
    int executionRound = 0;

    json toJson() const;
};

/**
 * @brief Exploration progress driving the scoring policy
 *
 * Single writer: the owning AdaptiveScheduler. Empty strings are "no signal"
 * and every mutator ignores them. An id is never in both the failed and the
 * completed set.
 */
class GAIAState {
public:
    void markUrlVisited(const std::string &url);

    /**
     * @brief Record a DOM signature and make it the current one
     */
    void markDomSeen(const std::string &domSignature);

    void markTestFailed(const std::string &testId);

    /**
     * @brief Record completion; also clears the id from the failed set
     */
    void markTestCompleted(const std::string &testId);

    void incrementRound();

    bool isUrlNew(const std::string &url) const;
    bool isDomNew(const std::string &domSignature) const;
    bool wasTestFailed(const std::string &testId) const;
    bool isTestCompleted(const std::string &testId) const;

    /**
     * @brief Restore the initial empty state (full scheduler reset only)
     */
    void reset();

    StateStats getStats() const;

    const std::unordered_set<std::string> &getVisitedUrls() const {
        return visitedUrls_;
    }

    const std::unordered_set<std::string> &getVisitedDomSignatures() const {
        return visitedDomSignatures_;
    }

    const std::unordered_set<std::string> &getFailedTestIds() const {
        return failedTestIds_;
    }

    const std::unordered_set<std::string> &getCompletedTestIds() const {
        return completedTestIds_;
    }

    const std::optional<std::string> &getCurrentDomSignature() const {
        return currentDomSignature_;
    }

    int getExecutionRound() const {
        return executionRound_;
    }

private:
    std::unordered_set<std::string> visitedUrls_;
    std::unordered_set<std::string> visitedDomSignatures_;
    std::unordered_set<std::string> failedTestIds_;
    std::unordered_set<std::string> completedTestIds_;
    std::optional<std::string> currentDomSignature_;
    int executionRound_ = 0;
};

}  // namespace GAIA

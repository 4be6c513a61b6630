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

#include "scheduling/GAIAState.h"

namespace GAIA {

json StateStats::toJson() const {
    return json{{"visited_urls_count", visitedUrls},
                {"visited_dom_count", visitedDoms},
                {"failed_tests_count", failedTests},
                {"completed_tests_count", completedTests},
                {"execution_round", executionRound}};
}

void GAIAState::markUrlVisited(const std::string &url) {
    if (!url.empty()) {
        visitedUrls_.insert(url);
    }
}

void GAIAState::markDomSeen(const std::string &domSignature) {
    if (!domSignature.empty()) {
        visitedDomSignatures_.insert(domSignature);
        currentDomSignature_ = domSignature;
    }
}

void GAIAState::markTestFailed(const std::string &testId) {
    if (testId.empty()) {
        return;
    }
    // Keep the sets disjoint; completion is final
    if (completedTestIds_.count(testId) > 0) {
        return;
    }
    failedTestIds_.insert(testId);
}

void GAIAState::markTestCompleted(const std::string &testId) {
    if (!testId.empty()) {
        completedTestIds_.insert(testId);
        failedTestIds_.erase(testId);
    }
}

void GAIAState::incrementRound() {
    ++executionRound_;
}

bool GAIAState::isUrlNew(const std::string &url) const {
    return visitedUrls_.count(url) == 0;
}

bool GAIAState::isDomNew(const std::string &domSignature) const {
    return visitedDomSignatures_.count(domSignature) == 0;
}

bool GAIAState::wasTestFailed(const std::string &testId) const {
    return failedTestIds_.count(testId) > 0;
}

bool GAIAState::isTestCompleted(const std::string &testId) const {
    return completedTestIds_.count(testId) > 0;
}

void GAIAState::reset() {
    visitedUrls_.clear();
    visitedDomSignatures_.clear();
    failedTestIds_.clear();
    completedTestIds_.clear();
    currentDomSignature_.reset();
    executionRound_ = 0;
}

StateStats GAIAState::getStats() const {
    StateStats stats;
    stats.visitedUrls = visitedUrls_.size();
    stats.visitedDoms = visitedDomSignatures_.size();
    stats.failedTests = failedTestIds_.size();
    stats.completedTests = completedTestIds_.size();
    stats.executionRound = executionRound_;
    return stats;
}

}  // namespace GAIA

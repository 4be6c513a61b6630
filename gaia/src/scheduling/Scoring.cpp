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

#include "scheduling/Scoring.h"
#include <algorithm>
#include <cstdint>
#include <limits>

namespace GAIA {

json ScoreBreakdown::toJson() const {
    return json{{"total_score", totalScore},         {"base_score", baseScore},
                {"dom_bonus", domBonus},             {"url_bonus", urlBonus},
                {"fail_bonus", failBonus},           {"no_change_penalty", noChangePenalty},
                {"new_elements_count", newElementsCount}};
}

int basePriorityScore(const std::string &priority) {
    auto parsed = parsePriority(priority);
    if (!parsed) {
        return 0;
    }

    switch (*parsed) {
    case Priority::Must:
        return Scoring::BASE_MUST;
    case Priority::Should:
        return Scoring::BASE_SHOULD;
    case Priority::May:
        return Scoring::BASE_MAY;
    default:
        return 0;
    }
}

ScoreBreakdown computeScoreBreakdown(const TestItem &item, const GAIAState &state) {
    ScoreBreakdown breakdown;
    breakdown.baseScore = basePriorityScore(item.priority);
    breakdown.newElementsCount = std::clamp(item.newElements, 0, Scoring::MAX_SCORED_NEW_ELEMENTS);
    breakdown.domBonus = breakdown.newElementsCount * Scoring::BONUS_NEW_ELEMENT;

    if (item.targetUrl && !item.targetUrl->empty() && state.isUrlNew(*item.targetUrl)) {
        breakdown.urlBonus = Scoring::BONUS_UNSEEN_URL;
    }

    if (state.wasTestFailed(item.id)) {
        breakdown.failBonus = Scoring::BONUS_RECENT_FAIL;
    }

    if (item.noDomChange) {
        breakdown.noChangePenalty = -Scoring::PENALTY_NO_DOM_CHANGE;
    }

    int64_t raw = static_cast<int64_t>(breakdown.baseScore) + breakdown.domBonus + breakdown.urlBonus +
                  breakdown.failBonus + breakdown.noChangePenalty;
    breakdown.totalScore =
        static_cast<int>(std::clamp<int64_t>(raw, 0, std::numeric_limits<int>::max()));
    return breakdown;
}

int computePriorityScore(const TestItem &item, const GAIAState &state) {
    return computeScoreBreakdown(item, state).totalScore;
}

}  // namespace GAIA

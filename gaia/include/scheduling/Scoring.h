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
#include <limits>

namespace GAIA {

namespace Scoring {
constexpr int BASE_MUST = 100;
constexpr int BASE_SHOULD = 60;
constexpr int BASE_MAY = 30;

constexpr int BONUS_NEW_ELEMENT = 15;  // Per newly discovered interactive element
constexpr int BONUS_UNSEEN_URL = 20;
constexpr int BONUS_RECENT_FAIL = 10;
constexpr int PENALTY_NO_DOM_CHANGE = 25;

// Element counts above this are scored as this many, keeping domBonus within int
constexpr int MAX_SCORED_NEW_ELEMENTS = std::numeric_limits<int>::max() / BONUS_NEW_ELEMENT;
}  // namespace Scoring

/**
 * @brief Per-term view of a priority score
 *
 * noChangePenalty is reported as zero or a negative number. totalScore is the
 * sum clamped to [0, INT_MAX], so it differs from the raw sum of terms only
 * when that sum is negative or overflows int. newElementsCount is the count
 * actually scored, after the cap.
 */
struct ScoreBreakdown {
    int totalScore = 0;
    int baseScore = 0;
    int domBonus = 0;
    int urlBonus = 0;
    int failBonus = 0;
    int noChangePenalty = 0;
    int newElementsCount = 0;

    json toJson() const;
};

/**
 * @brief Base score of a priority label; unknown labels score 0
 *
 * Independent of TestItem::priorityLabel(), which defaults to "MAY" for
 * display purposes only.
 */
int basePriorityScore(const std::string &priority);

/**
 * @brief Priority score of an item against the current exploration state
 *
 *   base + 15 * new_elements
 *        + 20 if target_url is set and not yet visited
 *        + 10 if the item failed before
 *        - 25 if the item is flagged no_dom_change
 *
 * floored at 0 and capped at INT_MAX. new_elements counts above
 * Scoring::MAX_SCORED_NEW_ELEMENTS are scored as the cap. Pure and deterministic.
 */
int computePriorityScore(const TestItem &item, const GAIAState &state);

ScoreBreakdown computeScoreBreakdown(const TestItem &item, const GAIAState &state);

}  // namespace GAIA

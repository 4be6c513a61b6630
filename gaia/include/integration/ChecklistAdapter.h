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
#include <vector>

namespace GAIA {

/**
 * @brief Translation between the plan-analysis agent, the scheduler and the
 *        browser-automation backend
 *
 * Agent output:
 * @code
 * {
 *   "checklist": [
 *     {"id": "TC001", "name": "Login", "priority": "MUST",
 *      "category": "auth", "steps": ["open login page", {...}],
 *      "precondition": "...", "expected_result": "..."}
 *   ]
 * }
 * @endcode
 */
class ChecklistAdapter {
public:
    /**
     * @brief Convert agent output into schedulable items
     *
     * Returns an empty list for non-object input or a non-array checklist.
     * Entries keep name/category/steps/precondition/expected_result in the
     * payload; a missing priority defaults to "MAY" and a missing id stays
     * empty, so the scheduler drops that entry at ingestion. Scoring fields
     * start at their defaults.
     */
    static std::vector<TestItem> toTestItems(const json &agentOutput);

    /**
     * @brief Build the scenario document the execution backend runs for an item
     *
     * Plain-string steps become click steps described by the string;
     * structured steps pass through. The assertion checks that body is
     * visible and carries expected_result as its description.
     */
    static json toScenario(const TestItem &item);
};

}  // namespace GAIA

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

#include "integration/ChecklistAdapter.h"
#include "common/Logger.h"

namespace GAIA {

namespace {
constexpr const char *DEFAULT_STEP_ACTION = "click";
constexpr const char *DEFAULT_ASSERTION_SELECTOR = "body";
constexpr const char *DEFAULT_ASSERTION_CONDITION = "is_visible";

json payloadValue(const json &entry, const char *key, const json &fallback) {
    if (entry.is_object() && entry.contains(key) && !entry[key].is_null()) {
        return entry[key];
    }
    return fallback;
}
}  // namespace

std::vector<TestItem> ChecklistAdapter::toTestItems(const json &agentOutput) {
    std::vector<TestItem> items;

    if (!agentOutput.is_object()) {
        LOG_DEBUG("ChecklistAdapter: Ignoring non-object agent output");
        return items;
    }

    auto it = agentOutput.find("checklist");
    if (it == agentOutput.end() || !it->is_array()) {
        LOG_DEBUG("ChecklistAdapter: Agent output has no checklist array");
        return items;
    }

    for (const auto &entry : *it) {
        TestItem item(JsonUtils::getString(entry, "id"), JsonUtils::getString(entry, "priority", "MAY"));
        item.payload["name"] = JsonUtils::getString(entry, "name");
        item.payload["category"] = JsonUtils::getString(entry, "category");
        item.payload["steps"] = payloadValue(entry, "steps", json::array());
        item.payload["precondition"] = JsonUtils::getString(entry, "precondition");
        item.payload["expected_result"] = JsonUtils::getString(entry, "expected_result");
        items.push_back(std::move(item));
    }

    LOG_DEBUG("ChecklistAdapter: Converted {} checklist entries", items.size());
    return items;
}

json ChecklistAdapter::toScenario(const TestItem &item) {
    json steps = json::array();

    const json &sourceSteps = item.payload.is_object() && item.payload.contains("steps") ? item.payload["steps"]
                                                                                          : json::array();
    if (sourceSteps.is_array()) {
        for (const auto &step : sourceSteps) {
            if (step.is_string()) {
                steps.push_back(json{{"description", step.get<std::string>()},
                                     {"action", DEFAULT_STEP_ACTION},
                                     {"selector", ""},
                                     {"params", json::array()}});
            } else if (step.is_object()) {
                steps.push_back(step);
            }
        }
    }

    json assertion{{"description", JsonUtils::getString(item.payload, "expected_result")},
                   {"selector", DEFAULT_ASSERTION_SELECTOR},
                   {"condition", DEFAULT_ASSERTION_CONDITION},
                   {"params", json::array()}};

    json scenario{{"id", item.id},
                  {"priority", item.priorityLabel()},
                  {"scenario", JsonUtils::getString(item.payload, "name")},
                  {"steps", steps},
                  {"assertion", assertion}};

    if (item.targetUrl) {
        scenario["target_url"] = *item.targetUrl;
    }
    return scenario;
}

}  // namespace GAIA

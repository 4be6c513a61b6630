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

#include "common/DomSignature.h"
#include "common/JsonUtils.h"
#include "common/Logger.h"
#include "integration/ChecklistAdapter.h"
#include "scheduling/AdaptiveScheduler.h"
#include <iostream>
#include <map>
#include <string>

// Usage: gaia_adaptive_run <checklist.json> [scheduler_config.json]
//
// Runs an agent checklist through the scheduler against a simulated backend:
// items in category "flaky" fail on their first attempt, items in category
// "broken" fail fatally, everything else succeeds. Each execution lands on a
// page whose structure depends on the item's category, so the run exercises
// rescoring as new pages appear.
int main(int argc, char *argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <checklist.json> [scheduler_config.json]" << "\n";
        return 1;
    }

    GAIA::Logger::initialize("logs", true);

    GAIA::SchedulerConfig config;
    if (argc >= 3) {
        std::string error;
        auto loaded = GAIA::SchedulerConfig::loadFromFile(argv[2], &error);
        if (!loaded) {
            std::cerr << "Invalid scheduler config: " << error << "\n";
            return 1;
        }
        config = *loaded;
    }

    std::string error;
    auto agentOutput = GAIA::JsonUtils::loadFile(argv[1], &error);
    if (!agentOutput) {
        std::cerr << "Cannot read checklist: " << error << "\n";
        return 1;
    }

    GAIA::AdaptiveScheduler scheduler(config);
    scheduler.ingestItems(GAIA::ChecklistAdapter::toTestItems(*agentOutput));

    std::map<std::string, int> attempts;
    auto simulatedBackend = [&attempts](const GAIA::TestItem &item) {
        int attempt = ++attempts[item.id];
        std::string category = GAIA::JsonUtils::getString(item.payload, "category");

        GAIA::json page{{"elements", GAIA::json::array({{{"tag", "main"}, {"selector", "#" + category}}})}};
        std::string signature = GAIA::computeDomSignature(page);

        if (category == "broken") {
            auto result = GAIA::ExecutionResult::failure("backend rejected scenario", true);
            result.domSignature = signature;
            return result;
        }
        if (category == "flaky" && attempt == 1) {
            auto result = GAIA::ExecutionResult::failure("element not interactable yet");
            result.domSignature = signature;
            return result;
        }

        auto result = GAIA::ExecutionResult::success(signature);
        result.extra["scenario"] = GAIA::ChecklistAdapter::toScenario(item);
        return result;
    };

    GAIA::SchedulerSummary summary = scheduler.executeUntilComplete(simulatedBackend);

    std::cout << GAIA::JsonUtils::toPrettyString(summary.toJson()) << "\n";
    GAIA::Logger::flush();
    return 0;
}

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
#include <functional>
#include <optional>
#include <string>

namespace GAIA {

namespace ExecutionStatus {
constexpr const char *SUCCESS = "success";
constexpr const char *FAILED = "failed";
}  // namespace ExecutionStatus

/**
 * @brief Outcome reported by the execution backend for one TestItem
 *
 * Fields beyond the ones the scheduler interprets are kept in extra and end up
 * in the audit log under "details".
 */
struct ExecutionResult {
    std::string status;
    std::optional<std::string> domSignature;
    std::optional<std::string> currentUrl;
    std::optional<std::string> error;
    bool fatal = false;  // Suppresses retry of a failed item

    json extra = json::object();

    bool isSuccess() const {
        return status == ExecutionStatus::SUCCESS;
    }

    bool isFailure() const {
        return status == ExecutionStatus::FAILED;
    }

    static ExecutionResult success(std::optional<std::string> domSignature = std::nullopt,
                                   std::optional<std::string> currentUrl = std::nullopt);

    static ExecutionResult failure(std::string error, bool fatal = false);

    /**
     * @brief Parse a backend result map; a missing status reads as "failed"
     */
    static ExecutionResult fromJson(const json &object);

    json toJson() const;
};

/**
 * @brief Execution backend contract
 *
 * Blocking call; may throw. The scheduler converts exceptions into failed
 * results.
 */
using ExecutorCallback = std::function<ExecutionResult(const TestItem &)>;

}  // namespace GAIA

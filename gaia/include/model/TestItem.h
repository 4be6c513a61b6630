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
#include <optional>
#include <string>
#include <utility>

namespace GAIA {

/**
 * @brief Test item priority class
 */
enum class Priority { Must, Should, May };

/**
 * @brief Parse "MUST" / "SHOULD" / "MAY" (case-sensitive)
 * @return nullopt for any other label
 */
std::optional<Priority> parsePriority(const std::string &label);

const char *priorityToString(Priority priority);

/**
 * @brief One schedulable unit of exploration/test work
 *
 * The scheduler reads only the typed fields. Everything else an upstream
 * producer attached (steps, name, expected result, ...) travels in payload
 * and reaches the executor untouched.
 */
struct TestItem {
    std::string id;
    std::string priority;  // Raw label as ingested; may be unknown

    int newElements = 0;
    std::optional<std::string> targetUrl;
    bool noDomChange = false;

    json payload = json::object();

    TestItem() = default;

    TestItem(std::string itemId, std::string itemPriority)
        : id(std::move(itemId)), priority(std::move(itemPriority)) {}

    /**
     * @brief Priority label for logs and summaries ("MAY" when empty)
     */
    std::string priorityLabel() const;

    /**
     * @brief Build from an ingestion map
     *
     * @return nullopt when "id" or "priority" is missing or not a string.
     * Negative or non-integer "new_elements" reads as 0, an empty or null
     * "target_url" reads as absent.
     */
    static std::optional<TestItem> fromJson(const json &object);

    json toJson() const;
};

}  // namespace GAIA

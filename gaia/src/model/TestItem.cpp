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

#include "model/TestItem.h"

namespace GAIA {

namespace {
constexpr const char *KEY_ID = "id";
constexpr const char *KEY_PRIORITY = "priority";
constexpr const char *KEY_NEW_ELEMENTS = "new_elements";
constexpr const char *KEY_TARGET_URL = "target_url";
constexpr const char *KEY_NO_DOM_CHANGE = "no_dom_change";
}  // namespace

std::optional<Priority> parsePriority(const std::string &label) {
    if (label == "MUST") {
        return Priority::Must;
    } else if (label == "SHOULD") {
        return Priority::Should;
    } else if (label == "MAY") {
        return Priority::May;
    }
    return std::nullopt;
}

const char *priorityToString(Priority priority) {
    switch (priority) {
    case Priority::Must:
        return "MUST";
    case Priority::Should:
        return "SHOULD";
    case Priority::May:
        return "MAY";
    default:
        return "MAY";
    }
}

std::string TestItem::priorityLabel() const {
    return priority.empty() ? std::string(priorityToString(Priority::May)) : priority;
}

std::optional<TestItem> TestItem::fromJson(const json &object) {
    if (!object.is_object()) {
        return std::nullopt;
    }
    if (!object.contains(KEY_ID) || !object[KEY_ID].is_string()) {
        return std::nullopt;
    }
    if (!object.contains(KEY_PRIORITY) || !object[KEY_PRIORITY].is_string()) {
        return std::nullopt;
    }

    TestItem item(object[KEY_ID].get<std::string>(), object[KEY_PRIORITY].get<std::string>());

    // Counts beyond INT_MAX saturate rather than wrap
    item.newElements = JsonUtils::getInt(object, KEY_NEW_ELEMENTS, 0);
    if (item.newElements < 0) {
        item.newElements = 0;
    }

    std::string targetUrl = JsonUtils::getString(object, KEY_TARGET_URL);
    if (!targetUrl.empty()) {
        item.targetUrl = std::move(targetUrl);
    }

    item.noDomChange = JsonUtils::getBool(object, KEY_NO_DOM_CHANGE, false);

    for (auto it = object.begin(); it != object.end(); ++it) {
        const std::string &key = it.key();
        if (key == KEY_ID || key == KEY_PRIORITY || key == KEY_NEW_ELEMENTS || key == KEY_TARGET_URL ||
            key == KEY_NO_DOM_CHANGE) {
            continue;
        }
        item.payload[key] = it.value();
    }

    return item;
}

json TestItem::toJson() const {
    json object = payload.is_object() ? payload : json::object();
    object[KEY_ID] = id;
    object[KEY_PRIORITY] = priority;
    object[KEY_NEW_ELEMENTS] = newElements;
    object[KEY_TARGET_URL] = targetUrl ? json(*targetUrl) : json(nullptr);
    object[KEY_NO_DOM_CHANGE] = noDomChange;
    return object;
}

}  // namespace GAIA

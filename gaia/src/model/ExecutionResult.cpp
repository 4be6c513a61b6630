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

#include "model/ExecutionResult.h"

namespace GAIA {

namespace {
constexpr const char *KEY_STATUS = "status";
constexpr const char *KEY_DOM_SIGNATURE = "dom_signature";
constexpr const char *KEY_CURRENT_URL = "current_url";
constexpr const char *KEY_ERROR = "error";
constexpr const char *KEY_FATAL = "fatal";

std::optional<std::string> optionalString(const json &object, const char *key) {
    std::string value = JsonUtils::getString(object, key);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}
}  // namespace

ExecutionResult ExecutionResult::success(std::optional<std::string> domSignature,
                                         std::optional<std::string> currentUrl) {
    ExecutionResult result;
    result.status = ExecutionStatus::SUCCESS;
    result.domSignature = std::move(domSignature);
    result.currentUrl = std::move(currentUrl);
    return result;
}

ExecutionResult ExecutionResult::failure(std::string error, bool fatal) {
    ExecutionResult result;
    result.status = ExecutionStatus::FAILED;
    result.error = std::move(error);
    result.fatal = fatal;
    return result;
}

ExecutionResult ExecutionResult::fromJson(const json &object) {
    ExecutionResult result;
    result.status = JsonUtils::getString(object, KEY_STATUS, ExecutionStatus::FAILED);
    result.domSignature = optionalString(object, KEY_DOM_SIGNATURE);
    result.currentUrl = optionalString(object, KEY_CURRENT_URL);
    result.error = optionalString(object, KEY_ERROR);
    result.fatal = JsonUtils::getBool(object, KEY_FATAL, false);

    if (object.is_object()) {
        for (auto it = object.begin(); it != object.end(); ++it) {
            const std::string &key = it.key();
            if (key == KEY_STATUS || key == KEY_DOM_SIGNATURE || key == KEY_CURRENT_URL || key == KEY_ERROR ||
                key == KEY_FATAL) {
                continue;
            }
            result.extra[key] = it.value();
        }
    }

    return result;
}

json ExecutionResult::toJson() const {
    json object = extra.is_object() ? extra : json::object();
    object[KEY_STATUS] = status;
    if (domSignature) {
        object[KEY_DOM_SIGNATURE] = *domSignature;
    }
    if (currentUrl) {
        object[KEY_CURRENT_URL] = *currentUrl;
    }
    if (error) {
        object[KEY_ERROR] = *error;
    }
    if (fatal) {
        object[KEY_FATAL] = true;
    }
    return object;
}

}  // namespace GAIA

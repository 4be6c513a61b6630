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

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace GAIA {

using json = nlohmann::json;

/**
 * @brief Centralized JSON helpers on top of nlohmann/json
 *
 * Item payloads, executor results, the audit log and the config file all pass
 * through here so lookup defaults and error reporting stay consistent.
 */
class JsonUtils {
public:
    /**
     * @brief Parse JSON string with error handling
     * @param jsonString Input JSON string
     * @param errorOut Optional error message output
     * @return Parsed json or nullopt on failure
     */
    static std::optional<json> parseJson(const std::string &jsonString, std::string *errorOut = nullptr);

    /**
     * @brief Read and parse a JSON document from disk
     * @param path File path
     * @param errorOut Optional error message output
     * @return Parsed json or nullopt when the file is missing or malformed
     */
    static std::optional<json> loadFile(const std::string &path, std::string *errorOut = nullptr);

    /**
     * @brief Write a pretty-printed JSON document, creating parent directories
     * @return false on I/O failure (reason in errorOut)
     */
    static bool writeFile(const std::string &path, const json &value, std::string *errorOut = nullptr);

    static std::string toCompactString(const json &value);
    static std::string toPrettyString(const json &value);

    /**
     * @brief String member or default when missing / not a string
     */
    static std::string getString(const json &object, const std::string &key, const std::string &defaultValue = "");

    /**
     * @brief Integer member or default when missing / not an integer
     *
     * Values outside the int range saturate at INT_MIN / INT_MAX.
     */
    static int getInt(const json &object, const std::string &key, int defaultValue = 0);

    /**
     * @brief 64-bit integer member; unsigned values above INT64_MAX saturate
     */
    static int64_t getInt64(const json &object, const std::string &key, int64_t defaultValue = 0);

    /**
     * @brief Boolean member or default when missing / not a boolean
     */
    static bool getBool(const json &object, const std::string &key, bool defaultValue = false);

    /**
     * @brief Numeric member (integer or floating) or default
     */
    static double getDouble(const json &object, const std::string &key, double defaultValue = 0.0);

    /**
     * @brief Check if JSON object has key and it's not null
     */
    static bool hasKey(const json &object, const std::string &key);

    /**
     * @brief Current UTC time as ISO-8601 with milliseconds, e.g. 2025-10-22T14:00:00.123Z
     */
    static std::string utcTimestamp();
};

}  // namespace GAIA

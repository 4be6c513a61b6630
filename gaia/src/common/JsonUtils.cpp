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

#include "common/JsonUtils.h"
#include "common/LogUtils.h"
#include "common/Logger.h"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <format>
#include <fstream>
#include <limits>
#include <sstream>

namespace GAIA {

std::optional<json> JsonUtils::parseJson(const std::string &jsonString, std::string *errorOut) {
    if (jsonString.empty()) {
        if (errorOut) {
            *errorOut = "Empty JSON string";
        }
        return std::nullopt;
    }

    try {
        return json::parse(jsonString);
    } catch (const json::parse_error &e) {
        if (errorOut) {
            *errorOut = e.what();
        }
        LOG_DEBUG("JsonUtils: Failed to parse JSON: {}", Log::sanitize(e.what()));
        return std::nullopt;
    }
}

std::optional<json> JsonUtils::loadFile(const std::string &path, std::string *errorOut) {
    std::ifstream in(path);
    if (!in.is_open()) {
        if (errorOut) {
            *errorOut = "Cannot open file: " + path;
        }
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    return parseJson(buffer.str(), errorOut);
}

bool JsonUtils::writeFile(const std::string &path, const json &value, std::string *errorOut) {
    std::filesystem::path target(path);
    if (target.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            if (errorOut) {
                *errorOut = "Cannot create directory " + target.parent_path().string() + ": " + ec.message();
            }
            return false;
        }
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        if (errorOut) {
            *errorOut = "Cannot open file for writing: " + path;
        }
        return false;
    }

    out << toPrettyString(value) << "\n";
    out.flush();
    if (!out) {
        if (errorOut) {
            *errorOut = "Write failed: " + path;
        }
        return false;
    }
    return true;
}

std::string JsonUtils::toCompactString(const json &value) {
    return value.dump();
}

std::string JsonUtils::toPrettyString(const json &value) {
    // Non-ASCII payload text is kept verbatim; invalid UTF-8 is replaced instead of throwing
    return value.dump(2, ' ', false, json::error_handler_t::replace);
}

std::string JsonUtils::getString(const json &object, const std::string &key, const std::string &defaultValue) {
    if (!object.is_object() || !object.contains(key)) {
        return defaultValue;
    }

    const auto &value = object[key];
    if (!value.is_string()) {
        return defaultValue;
    }

    return value.get<std::string>();
}

int JsonUtils::getInt(const json &object, const std::string &key, int defaultValue) {
    int64_t value = getInt64(object, key, defaultValue);
    return static_cast<int>(std::clamp<int64_t>(value, std::numeric_limits<int>::min(),
                                                std::numeric_limits<int>::max()));
}

int64_t JsonUtils::getInt64(const json &object, const std::string &key, int64_t defaultValue) {
    if (!object.is_object() || !object.contains(key)) {
        return defaultValue;
    }

    const auto &value = object[key];
    if (!value.is_number_integer()) {
        return defaultValue;
    }

    if (value.is_number_unsigned()) {
        uint64_t unsignedValue = value.get<uint64_t>();
        if (unsignedValue > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return std::numeric_limits<int64_t>::max();
        }
        return static_cast<int64_t>(unsignedValue);
    }

    return value.get<int64_t>();
}

bool JsonUtils::getBool(const json &object, const std::string &key, bool defaultValue) {
    if (!object.is_object() || !object.contains(key)) {
        return defaultValue;
    }

    const auto &value = object[key];
    if (!value.is_boolean()) {
        return defaultValue;
    }

    return value.get<bool>();
}

double JsonUtils::getDouble(const json &object, const std::string &key, double defaultValue) {
    if (!object.is_object() || !object.contains(key)) {
        return defaultValue;
    }

    const auto &value = object[key];
    if (!value.is_number()) {
        return defaultValue;
    }

    return value.get<double>();
}

bool JsonUtils::hasKey(const json &object, const std::string &key) {
    return object.is_object() && object.contains(key) && !object[key].is_null();
}

std::string JsonUtils::utcTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    gmtime_s(&tm_buf, &now_time_t);
#else
    gmtime_r(&now_time_t, &tm_buf);
#endif

    return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z", tm_buf.tm_year + 1900, tm_buf.tm_mon + 1,
                       tm_buf.tm_mday, tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(now_ms.count()));
}

}  // namespace GAIA

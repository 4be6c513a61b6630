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
#include <string>

namespace GAIA {

/**
 * @brief Structural hash of a page's interactive elements
 *
 * Reads domData["elements"], an array of objects with "tag" and "selector".
 * Each element contributes "tag:selector"; the list is sorted and joined with
 * '|' so element order on the page does not affect the result. Returns the
 * lowercase hex MD5 of that string. Missing or malformed "elements" hashes the
 * empty string.
 */
std::string computeDomSignature(const json &domData);

/**
 * @brief Lowercase hex MD5 digest of raw bytes
 */
std::string md5Hex(const std::string &data);

}  // namespace GAIA

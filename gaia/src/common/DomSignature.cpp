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
#include <algorithm>
#include <openssl/evp.h>
#include <stdexcept>
#include <vector>

namespace GAIA {

std::string md5Hex(const std::string &data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;

    EVP_MD_CTX *ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw std::runtime_error("md5Hex: EVP_MD_CTX_new failed");
    }
    bool ok = EVP_DigestInit_ex(ctx, EVP_md5(), nullptr) == 1 &&
              EVP_DigestUpdate(ctx, data.data(), data.size()) == 1 &&
              EVP_DigestFinal_ex(ctx, digest, &digestLen) == 1;
    EVP_MD_CTX_free(ctx);
    if (!ok) {
        throw std::runtime_error("md5Hex: digest computation failed");
    }

    static constexpr char HEX[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(digestLen * 2);
    for (unsigned int i = 0; i < digestLen; ++i) {
        hex += HEX[digest[i] >> 4];
        hex += HEX[digest[i] & 0x0F];
    }
    return hex;
}

std::string computeDomSignature(const json &domData) {
    std::vector<std::string> elementSignatures;

    if (domData.is_object() && domData.contains("elements") && domData["elements"].is_array()) {
        for (const auto &element : domData["elements"]) {
            elementSignatures.push_back(JsonUtils::getString(element, "tag") + ":" +
                                        JsonUtils::getString(element, "selector"));
        }
    }

    std::sort(elementSignatures.begin(), elementSignatures.end());

    std::string joined;
    for (size_t i = 0; i < elementSignatures.size(); ++i) {
        if (i > 0) {
            joined += '|';
        }
        joined += elementSignatures[i];
    }

    return md5Hex(joined);
}

}  // namespace GAIA

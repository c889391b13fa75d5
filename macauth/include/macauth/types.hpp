/*
 * Part of the MacAuth (MA) project.
 *
 * SPDX-FileCopyrightText: 2025 MacAuth contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of MacAuth (MA). See LICENSE for details.
 */

#pragma once
#include <map>
#include <string>

namespace macauth {

// Literal scheme token of the Authorization header.
inline constexpr const char* kScheme = "MAC";

// Hash used inside the HMAC. Sha1 is what deployed clients expect.
enum class HashAlg {
    Sha1,
    Sha256,
    Sha512
};

// Protocol parameters (id, ts, nonce, ext, mac, ...). Ordered for stable output.
using ParamMap = std::map<std::string, std::string>;

// Parsed Authorization header: scheme token plus its key/value list.
struct AuthzHeader {
    std::string scheme;
    ParamMap    params;
};

} // namespace macauth

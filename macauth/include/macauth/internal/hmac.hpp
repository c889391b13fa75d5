/*
 * Part of the MacAuth (MA) project.
 *
 * SPDX-FileCopyrightText: 2025 MacAuth contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of MacAuth (MA). See LICENSE for details.
 */

#pragma once
#include <string>
#include "macauth/types.hpp"

namespace macauth::internal {

// Raw HMAC digest of msg under key. Throws CryptoError.
std::string hmac_bin(HashAlg alg, const std::string& key, const std::string& msg);

// base64(HMAC(key, msg)) as carried in the "mac" parameter.
std::string hmac_base64(HashAlg alg, const std::string& key, const std::string& msg);

// "sha1" / "sha256" / "sha512" (case-insensitive). Returns false if unknown.
bool parse_hash_alg(const std::string& name, HashAlg& out);

} // namespace macauth::internal

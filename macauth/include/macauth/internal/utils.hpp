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
#include <cstddef>

namespace macauth::internal {

// Trim spaces from both sides (in-place).
void trim_inplace(std::string& s);

// Hex helpers
std::string bytes_to_hex(const unsigned char* p, std::size_t n);

// Hex string of n_bytes from the OpenSSL CSPRNG. Throws CryptoError.
std::string random_hex(std::size_t n_bytes);

// Standard base64 with padding.
std::string base64_encode(const std::string& bin);

// Constant-time equality (length is not hidden).
bool ct_equal(const std::string& a, const std::string& b);

// Upper / lower
std::string upper_copy(std::string s);
std::string lower_copy(std::string s);

// Securely wipe string contents
void secure_wipe(std::string& s);

} // namespace macauth::internal

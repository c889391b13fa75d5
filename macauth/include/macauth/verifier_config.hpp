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
#include "macauth/types.hpp"

namespace macauth {

struct VerifierConfig {
    // Replay window
    int         nonce_ttl_sec = 60;
    int         id_ttl_sec    = 0;   // 0: same as nonce_ttl_sec
    std::size_t max_size      = 0;   // 0: unbounded (per id and for ids)

    HashAlg hash = HashAlg::Sha1;

    // "<id> <key>" lines. Empty: start with no keys and add them through
    // Verifier::keys().
    std::string key_file;
};

} // namespace macauth

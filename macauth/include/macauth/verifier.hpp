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
#include "macauth/http_request.hpp"
#include "macauth/nonce_cache.hpp"
#include "macauth/verifier_config.hpp"
#include "macauth/internal/key_store.hpp"

namespace macauth {

struct VerifyResult {
    bool ok = false;
    std::string id; // claimed id, set only when ok
};

// Server-side facade: id -> key lookup -> check_signature, with its own
// replay cache. Thread-safe.
class Verifier {
public:
    // Throws std::runtime_error on a bad replay window or an unreadable key file.
    explicit Verifier(const VerifierConfig& cfg);

    VerifyResult verify(const HttpRequest& R);

    internal::KeyStore& keys() noexcept { return _keys; }
    NonceCache& nonces() noexcept { return _nonces; }

private:
    VerifierConfig        _cfg;
    internal::KeyStore    _keys;
    NonceCache            _nonces;
};

} // namespace macauth

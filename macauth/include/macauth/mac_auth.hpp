/*
 * Part of the MacAuth (MA) project.
 *
 * SPDX-FileCopyrightText: 2025 MacAuth contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of MacAuth (MA). See LICENSE for details.
 */

#pragma once
#include <optional>
#include <string>
#include "macauth/http_request.hpp"
#include "macauth/nonce_cache.hpp"
#include "macauth/types.hpp"

namespace macauth {

struct SignOptions {
    HashAlg hash = HashAlg::Sha1;
    // Parameters to sign with. When unset, the ones already in the request's
    // Authorization header are reused (if that header is a MAC header).
    std::optional<ParamMap> params;
};

struct CheckOptions {
    HashAlg hash = HashAlg::Sha1;
    // Pre-parsed header. When unset, the request's Authorization header is parsed.
    std::optional<AuthzHeader> params;
    // Replay cache. nullptr selects default_nonce_cache().
    NonceCache* nonces = nullptr;
    // false: verify the signature only, without any replay tracking.
    bool check_nonce = true;
};

/**
 * Sign the request: fill in id, ts (now) and nonce (random) where missing,
 * compute mac, and install the resulting "MAC ..." Authorization header.
 * Returns the header value. Errors propagate (MalformedHeader from the
 * caller's own header is ignored, UnknownScheme is not).
 */
std::string sign_request(HttpRequest& R, const std::string& id,
                         const std::string& key, const SignOptions& opt = {});

// Claimed MAC id of the request, without any verification.
std::optional<std::string> get_id(const HttpRequest& R,
                                  const std::optional<AuthzHeader>& params = std::nullopt);

// base64 HMAC over the normalized request string.
std::string get_signature(const HttpRequest& R, const std::string& key,
                          HashAlg hash = HashAlg::Sha1,
                          const std::optional<ParamMap>& params = std::nullopt);

/**
 * Server-side check. Returns true only if the header is a well-formed MAC
 * header, the (id, ts, nonce) triple is fresh, and the mac matches. Never
 * throws on bad input and never says which of those failed.
 */
bool check_signature(const HttpRequest& R, const std::string& key,
                     const CheckOptions& opt = {});

// Process-wide cache used when CheckOptions::nonces is null.
// Built on first use with the default TTLs, never reset.
NonceCache& default_nonce_cache();

} // namespace macauth

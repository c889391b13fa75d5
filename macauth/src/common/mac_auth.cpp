/*
 * Part of the MacAuth (MA) project.
 *
 * SPDX-FileCopyrightText: 2025 MacAuth contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of MacAuth (MA). See LICENSE for details.
 */

#include "macauth/mac_auth.hpp"
#include "macauth/errors.hpp"
#include "macauth/log.hpp"
#include "macauth/internal/authz_header.hpp"
#include "macauth/internal/canonical.hpp"
#include "macauth/internal/hmac.hpp"
#include "macauth/internal/http_parser.hpp"
#include "macauth/internal/utils.hpp"
#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstdint>

namespace macauth {

namespace {

// Latest second the cache clock can represent (2262 with nanosecond ticks),
// and never past 9999-12-31T23:59:59Z.
constexpr std::int64_t kMaxTimestamp = std::min<std::int64_t>(
    253402300799LL,
    std::chrono::duration_cast<std::chrono::seconds>(
        NonceCache::time_point::max().time_since_epoch()).count());

// Nonce length in random bytes (hex-encoded on the wire).
constexpr std::size_t kNonceBytes = 5;

std::int64_t now_epoch() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

const std::string& require_param(const ParamMap& p, const char* name) {
    auto it = p.find(name);
    if (it == p.end()) throw MissingParameter(name);
    return it->second;
}

// Integer seconds since the epoch, optionally signed.
NonceCache::time_point parse_timestamp(const std::string& s) {
    std::int64_t v = 0;
    const char* first = s.data();
    const char* last  = s.data() + s.size();
    if (first != last && *first == '+') ++first;
    auto res = std::from_chars(first, last, v);
    if (s.empty() || res.ec != std::errc() || res.ptr != last) {
        throw InvalidParameter("bad timestamp: " + s);
    }
    if (v < 0 || v > kMaxTimestamp) {
        throw InvalidParameter("timestamp out of range: " + s);
    }
    return NonceCache::time_point(std::chrono::seconds(v));
}

ParamMap params_from_request(const HttpRequest& R) {
    return internal::parse_authz_header(R, AuthzHeader{}).params;
}

} // namespace

std::string sign_request(HttpRequest& R, const std::string& id,
                         const std::string& key, const SignOptions& opt)
{
    ParamMap params;
    if (opt.params) {
        params = *opt.params;
    } else {
        AuthzHeader h = internal::parse_authz_header(R, AuthzHeader{});
        if (h.scheme == kScheme) params = std::move(h.params);
    }

    params["id"] = id;
    if (params.find("ts") == params.end()) {
        params["ts"] = std::to_string(now_epoch());
    }
    if (params.find("nonce") == params.end()) {
        params["nonce"] = internal::random_hex(kNonceBytes);
    }
    params.erase("mac");
    params["mac"] = get_signature(R, key, opt.hash, params);

    const std::string value = internal::serialize_authz_header(AuthzHeader{kScheme, params});
    internal::set_hdr_ci(R, "Authorization", value);
    return value;
}

std::optional<std::string> get_id(const HttpRequest& R,
                                  const std::optional<AuthzHeader>& params)
{
    const AuthzHeader h = params ? *params : internal::parse_authz_header(R, AuthzHeader{});
    if (h.scheme != kScheme) return std::nullopt;
    auto it = h.params.find("id");
    if (it == h.params.end()) return std::nullopt;
    return it->second;
}

std::string get_signature(const HttpRequest& R, const std::string& key,
                          HashAlg hash, const std::optional<ParamMap>& params)
{
    const ParamMap p = params ? *params : params_from_request(R);
    const std::string sigstr = internal::normalized_request_string(R, p);
    return internal::hmac_base64(hash, key, sigstr);
}

bool check_signature(const HttpRequest& R, const std::string& key,
                     const CheckOptions& opt)
{
    try {
        const AuthzHeader h = opt.params ? *opt.params : internal::parse_authz_header(R);
        if (h.scheme != kScheme) {
            log_line("[AUTH] reject: scheme is not " + std::string(kScheme));
            return false;
        }

        const std::string& id    = require_param(h.params, "id");
        const auto ts            = parse_timestamp(require_param(h.params, "ts"));
        const std::string& nonce = require_param(h.params, "nonce");
        const std::string& mac   = require_param(h.params, "mac");

        // The nonce is consumed here, before the signature is known to be
        // good, so that check and record cannot race.
        if (opt.check_nonce) {
            NonceCache& nonces = opt.nonces ? *opt.nonces : default_nonce_cache();
            if (!nonces.check_nonce(id, ts, nonce)) {
                log_line("[AUTH] reject id=" + id + ": stale or replayed nonce");
                return false;
            }
        }

        const std::string expected = get_signature(R, key, opt.hash, h.params);
        if (!internal::ct_equal(expected, mac)) {
            log_line("[AUTH] reject id=" + id + ": bad signature");
            return false;
        }
        return true;
    } catch (const Error& e) {
        log_line(std::string("[AUTH] reject: ") + e.what());
        return false;
    }
}

NonceCache& default_nonce_cache() {
    static NonceCache cache;
    return cache;
}

} // namespace macauth

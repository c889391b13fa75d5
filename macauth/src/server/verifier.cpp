/*
 * Part of the MacAuth (MA) project.
 *
 * SPDX-FileCopyrightText: 2025 MacAuth contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of MacAuth (MA). See LICENSE for details.
 */

#include "macauth/verifier.hpp"
#include "macauth/mac_auth.hpp"
#include "macauth/log.hpp"
#include "macauth/internal/utils.hpp"

#include <chrono>
#include <optional>
#include <stdexcept>

namespace macauth {

static std::optional<std::size_t> size_limit(const VerifierConfig& cfg) {
    if (cfg.max_size == 0) return std::nullopt;
    return cfg.max_size;
}

Verifier::Verifier(const VerifierConfig& cfg)
    : _cfg(cfg),
      _nonces(std::chrono::seconds(cfg.nonce_ttl_sec),
              cfg.id_ttl_sec > 0
                  ? std::optional<NonceCache::duration>(std::chrono::seconds(cfg.id_ttl_sec))
                  : std::nullopt,
              size_limit(cfg))
{
    if (_cfg.nonce_ttl_sec <= 0) {
        throw std::runtime_error("Verifier: nonce_ttl_sec must be positive");
    }

    if (!_cfg.key_file.empty() && !_keys.load_file(_cfg.key_file)) {
        throw std::runtime_error("Verifier: cannot load key file " + _cfg.key_file);
    }
}

VerifyResult Verifier::verify(const HttpRequest& R) {
    VerifyResult vr;

    const auto id = get_id(R);
    if (!id) {
        log_line("[AUTH] reject: no MAC id");
        return vr;
    }

    std::string key;
    if (!_keys.lookup(*id, key)) {
        log_line("[AUTH] reject id=" + *id + ": unknown id");
        return vr;
    }

    CheckOptions opt;
    opt.hash   = _cfg.hash;
    opt.nonces = &_nonces;
    const bool ok = check_signature(R, key, opt);
    internal::secure_wipe(key);

    if (ok) {
        vr.ok = true;
        vr.id = *id;
    }
    return vr;
}

} // namespace macauth

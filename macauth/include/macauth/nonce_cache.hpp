/*
 * Part of the MacAuth (MA) project.
 *
 * SPDX-FileCopyrightText: 2025 MacAuth contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of MacAuth (MA). See LICENSE for details.
 */

#pragma once
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include "macauth/ttl_cache.hpp"

namespace macauth {

// Anti-replay cache: per-id clock skew plus the nonces seen for that id.
//
// The skew of an id is measured on its first request and kept until the id
// entry expires (id_ttl). Timestamps are shifted by that skew before the
// window test, so clients with a wrong but steady clock are accepted.
// With max_size set, entries may be evicted before they expire, which
// reopens a replay window under memory pressure.
class NonceCache {
public:
    using clock      = std::chrono::system_clock;
    using time_point = clock::time_point;
    using duration   = clock::duration;

    static constexpr std::chrono::seconds kDefaultTtl{60};

    // id_ttl defaults to nonce_ttl.
    explicit NonceCache(duration nonce_ttl = kDefaultTtl,
                        std::optional<duration> id_ttl = std::nullopt,
                        std::optional<std::size_t> max_size = std::nullopt);

    // True if (timestamp, nonce) is fresh for id; the nonce is consumed in
    // the same step, so a second call with the same triple returns false.
    bool check_nonce(const std::string& id, time_point timestamp,
                     const std::string& nonce);

    // Live nonces over all live ids. O(ids).
    std::size_t len() const;

    duration nonce_ttl() const noexcept { return _nonce_ttl; }
    duration id_ttl() const noexcept { return _id_ttl; }
    std::optional<std::size_t> max_size() const noexcept { return _max_size; }

private:
    using NonceSet = TtlCache<std::string, bool>;

    struct IdEntry {
        duration                  skew{};
        std::shared_ptr<NonceSet> nonces;
    };

    const duration                   _nonce_ttl;
    const duration                   _id_ttl;
    const std::optional<std::size_t> _max_size;
    std::shared_ptr<std::shared_mutex> _lock;   // shared by _ids and every NonceSet
    TtlCache<std::string, IdEntry>   _ids;
};

} // namespace macauth

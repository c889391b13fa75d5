/*
 * Part of the MacAuth (MA) project.
 *
 * SPDX-FileCopyrightText: 2025 MacAuth contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of MacAuth (MA). See LICENSE for details.
 */

#include "macauth/nonce_cache.hpp"
#include "macauth/errors.hpp"

namespace macauth {

namespace {

using std::chrono::duration_cast;
using std::chrono::seconds;

seconds whole_seconds(NonceCache::time_point t) {
    return duration_cast<seconds>(t.time_since_epoch());
}

// Widest skew a clock duration can hold, less a few seconds for truncation.
const seconds kMaxSkew = duration_cast<seconds>(NonceCache::duration::max()) - seconds(4);

} // namespace

NonceCache::NonceCache(duration nonce_ttl,
                       std::optional<duration> id_ttl,
                       std::optional<std::size_t> max_size)
    : _nonce_ttl(nonce_ttl),
      _id_ttl(id_ttl ? *id_ttl : nonce_ttl),
      _max_size(max_size),
      _lock(std::make_shared<std::shared_mutex>()),
      _ids(_id_ttl, _max_size, _lock)
{
}

bool NonceCache::check_nonce(const std::string& id, time_point timestamp,
                             const std::string& nonce)
{
    const auto now = clock::now();

    // Clock skew for this id; first sighting measures it.
    IdEntry entry;
    try {
        entry = _ids.get(id);
    } catch (const NotFound&) {
        // Range-check in whole seconds: timestamp is client input.
        const seconds diff = whole_seconds(now) - whole_seconds(timestamp);
        if (diff > kMaxSkew || -diff > kMaxSkew) {
            return false;
        }
        IdEntry fresh;
        fresh.skew   = now - timestamp;
        fresh.nonces = std::make_shared<NonceSet>(_nonce_ttl, _max_size, _lock);
        try {
            _ids.set(id, fresh, now);
            entry = std::move(fresh);
        } catch (const KeyExists<IdEntry>& e) {
            // Lost the race to a concurrent first request; use its skew.
            entry = e.old_value();
        }
    }

    // Too old or too new: reject without touching the nonce store.
    // Coarse pass first; timestamp + skew need not fit in a time_point.
    const seconds coarse = whole_seconds(timestamp) + duration_cast<seconds>(entry.skew)
                         - whole_seconds(now);
    const seconds slack  = duration_cast<seconds>(_nonce_ttl) + seconds(4);
    if (coarse > slack || -coarse > slack) {
        return false;
    }
    const time_point adjusted = timestamp + entry.skew;
    const duration delta = adjusted - now;
    if (delta >= _nonce_ttl || -delta >= _nonce_ttl) {
        return false;
    }

    try {
        entry.nonces->set(nonce, true, adjusted);
    } catch (const KeyExists<bool>&) {
        return false; // replay
    }
    return true;
}

std::size_t NonceCache::len() const {
    std::size_t total = 0;
    for (const auto& id : _ids.iterate()) {
        try {
            total += _ids.get(id).nonces->iterate().size();
        } catch (const NotFound&) {
            // expired between iterate() and get()
        }
    }
    return total;
}

} // namespace macauth

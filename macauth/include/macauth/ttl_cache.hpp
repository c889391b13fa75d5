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
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <shared_mutex>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>
#include "macauth/errors.hpp"

namespace macauth {

/**
 * In-memory key/value store with timestamp-based expiry.
 *
 * An entry is visible while  timestamp + ttl >= now.  Expired entries stay in
 * the map until a later set() purges them; readers simply ignore them.
 * Purging walks a min-heap of (timestamp, key).  The heap is append-only: an
 * overwritten key leaves a stale heap node behind, and a popped node only
 * erases the map entry if the timestamps still agree.
 *
 * set() never overwrites a live key (KeyExists). With max_size set, a write
 * into a full cache evicts the oldest entry even if it has not expired.
 *
 * Writers hold the lock exclusively, readers hold it shared. The lock may be
 * shared by several caches (see NonceCache).
 */
template <class K, class V, class Hash = std::hash<K>>
class TtlCache {
public:
    using clock      = std::chrono::system_clock;
    using time_point = clock::time_point;
    using duration   = clock::duration;
    using lock_type  = std::shared_mutex;

    // Age-based evictions attempted per set().
    static constexpr int kPurgePerWrite = 5;

    explicit TtlCache(duration ttl,
                      std::optional<std::size_t> max_size = std::nullopt,
                      std::shared_ptr<lock_type> lock = nullptr)
        : _ttl(ttl), _max_size(max_size),
          _lock(lock ? std::move(lock) : std::make_shared<lock_type>())
    {
        if (_max_size && *_max_size == 0) {
            throw std::invalid_argument("TtlCache: max_size must be positive");
        }
    }

    TtlCache(const TtlCache&) = delete;
    TtlCache& operator=(const TtlCache&) = delete;

    // Throws NotFound if absent or expired.
    V get(const K& key) const {
        std::shared_lock<lock_type> lk(*_lock);
        auto it = _items.find(key);
        if (it == _items.end() || expired(it->second.timestamp, clock::now())) {
            throw NotFound();
        }
        return it->second.value;
    }

    bool contains(const K& key) const {
        std::shared_lock<lock_type> lk(*_lock);
        auto it = _items.find(key);
        return it != _items.end() && !expired(it->second.timestamp, clock::now());
    }

    void set(const K& key, V value) { set(key, std::move(value), clock::now()); }

    // Throws KeyExists<V> (with the stored value) if key is live.
    void set(const K& key, V value, time_point timestamp) {
        const auto now = clock::now();
        std::unique_lock<lock_type> lk(*_lock);

        auto it = _items.find(key);
        const bool replacing = (it != _items.end());
        if (replacing && !expired(it->second.timestamp, now)) {
            throw KeyExists<V>(it->second.value);
        }

        // Stay within max_size. Stale heap nodes do not count as an eviction.
        if (!replacing && _max_size) {
            while (_items.size() >= *_max_size && !_queue.empty()) {
                if (pop_oldest_locked()) break;
            }
        }

        // Purge a few expired items, not all of them, to bound the pause.
        const auto deadline = now - _ttl;
        for (int i = 0; i < kPurgePerWrite && !_queue.empty(); ++i) {
            if (_queue.top().first >= deadline) break;
            (void)pop_oldest_locked();
        }

        _items[key] = Entry{std::move(value), timestamp};
        _queue.emplace(timestamp, key);
    }

    // Snapshot of the keys that are live right now.
    std::vector<K> iterate() const {
        const auto now = clock::now();
        std::shared_lock<lock_type> lk(*_lock);
        std::vector<K> keys;
        keys.reserve(_items.size());
        for (const auto& kv : _items) {
            if (!expired(kv.second.timestamp, now)) keys.push_back(kv.first);
        }
        return keys;
    }

    // Physical entry count, expired-but-not-purged entries included.
    std::size_t size() const {
        std::shared_lock<lock_type> lk(*_lock);
        return _items.size();
    }

    duration ttl() const noexcept { return _ttl; }
    std::optional<std::size_t> max_size() const noexcept { return _max_size; }

private:
    struct Entry {
        V          value;
        time_point timestamp;
    };
    using QueueItem = std::pair<time_point, K>;
    struct QueueOrder {
        bool operator()(const QueueItem& a, const QueueItem& b) const {
            return a.first > b.first;
        }
    };

    bool expired(time_point ts, time_point now) const {
        return ts + _ttl < now;
    }

    // Pop the heap minimum; erase its entry unless the node is stale.
    bool pop_oldest_locked() {
        QueueItem top = _queue.top();
        _queue.pop();
        auto it = _items.find(top.second);
        if (it == _items.end() || it->second.timestamp != top.first) {
            return false;
        }
        _items.erase(it);
        return true;
    }

    const duration                   _ttl;
    const std::optional<std::size_t> _max_size;
    std::shared_ptr<lock_type>       _lock;
    std::unordered_map<K, Entry, Hash> _items;
    std::priority_queue<QueueItem, std::vector<QueueItem>, QueueOrder> _queue;
};

} // namespace macauth

/*
 * Part of the MacAuth (MA) project.
 *
 * SPDX-FileCopyrightText: 2025 MacAuth contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of MacAuth (MA). See LICENSE for details.
 */

#pragma once
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace macauth::internal {

/**
 * id -> MAC key map used by the Verifier.
 *
 * Filled from a key file ("<id> <key>" per line, '#' comments, blank lines
 * ignored) or one id at a time with put(). Keys are wiped from memory when
 * replaced and when the store goes away. Thread-safe.
 */
class KeyStore {
public:
    KeyStore() = default;
    ~KeyStore();

    KeyStore(const KeyStore&) = delete;
    KeyStore& operator=(const KeyStore&) = delete;

    // Replaces the whole map. A bad or duplicate line leaves the store
    // unchanged and returns false.
    bool load_file(const std::string& path);

    void put(const std::string& id, std::string key);

    // False if id is unknown.
    bool lookup(const std::string& id, std::string& out_key) const;

    std::size_t size() const;

private:
    using Map = std::unordered_map<std::string, std::string>;
    static void wipe_all(Map& m);

    mutable std::mutex _mtx;
    Map                _keys;
};

} // namespace macauth::internal

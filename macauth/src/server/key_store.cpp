/*
 * Part of the MacAuth (MA) project.
 *
 * SPDX-FileCopyrightText: 2025 MacAuth contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of MacAuth (MA). See LICENSE for details.
 */

#include "macauth/internal/key_store.hpp"
#include "macauth/internal/utils.hpp"
#include "macauth/log.hpp"

#include <fstream>
#include <sstream>

namespace macauth::internal {

void KeyStore::wipe_all(Map& m) {
    for (auto& kv : m) secure_wipe(kv.second);
    m.clear();
}

KeyStore::~KeyStore() {
    std::lock_guard<std::mutex> lk(_mtx);
    wipe_all(_keys);
}

bool KeyStore::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.good()) {
        log_line("[KEYS] cannot open key file: " + path);
        return false;
    }

    Map loaded;
    std::size_t line_no = 0;
    for (std::string line; std::getline(in, line); ) {
        ++line_no;
        trim_inplace(line);
        if (line.empty() || line[0] == '#') continue;

        std::istringstream fields(line);
        std::string id, key, rest;
        const bool two_fields = (fields >> id >> key) && !(fields >> rest);
        secure_wipe(line);
        if (!two_fields) {
            log_line("[KEYS] " + path + ":" + std::to_string(line_no) + ": expected \"<id> <key>\"");
            secure_wipe(key);
            wipe_all(loaded);
            return false;
        }
        if (!loaded.try_emplace(id, std::move(key)).second) {
            log_line("[KEYS] " + path + ":" + std::to_string(line_no) + ": duplicate id " + id);
            secure_wipe(key);
            wipe_all(loaded);
            return false;
        }
    }

    const std::size_t count = loaded.size();
    {
        std::lock_guard<std::mutex> lk(_mtx);
        _keys.swap(loaded);
    }
    wipe_all(loaded);
    log_line("[KEYS] loaded " + std::to_string(count) + " keys from " + path);
    return true;
}

void KeyStore::put(const std::string& id, std::string key) {
    std::lock_guard<std::mutex> lk(_mtx);
    auto it = _keys.find(id);
    if (it != _keys.end()) {
        secure_wipe(it->second);
        it->second = std::move(key);
    } else {
        _keys.emplace(id, std::move(key));
    }
}

bool KeyStore::lookup(const std::string& id, std::string& out_key) const {
    std::lock_guard<std::mutex> lk(_mtx);
    auto it = _keys.find(id);
    if (it == _keys.end()) return false;
    out_key = it->second;
    return true;
}

std::size_t KeyStore::size() const {
    std::lock_guard<std::mutex> lk(_mtx);
    return _keys.size();
}

} // namespace macauth::internal

/*
 * Part of the MacAuth (MA) project.
 *
 * SPDX-FileCopyrightText: 2025 MacAuth contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of MacAuth (MA). See LICENSE for details.
 */

#include "macauth/internal/http_parser.hpp"
#include "macauth/internal/utils.hpp"
#include <strings.h> // strcasecmp
#include <charconv>
#include <sstream>

namespace macauth::internal {

bool parse_request_line(const std::string& line, macauth::HttpRequest& r) {
    std::istringstream iss(line);
    std::string target, extra;
    if (!(iss >> r.method >> target >> r.httpver)) return false;
    if (iss >> extra) return false;
    if (target.empty() || r.httpver.compare(0, 5, "HTTP/") != 0) return false;

    // Absolute-form target: keep only the path part.
    if (target[0] != '/' && target != "*") {
        const std::size_t scheme_end = target.find("://");
        if (scheme_end == std::string::npos) return false;
        r.scheme = lower_copy(target.substr(0, scheme_end));
        const std::size_t slash = target.find('/', scheme_end + 3);
        target = (slash == std::string::npos) ? "/" : target.substr(slash);
    }

    const std::size_t q = target.find('?');
    if (q == std::string::npos) {
        r.path = target;
        r.query.clear();
    } else {
        r.path  = target.substr(0, q);
        r.query = target.substr(q + 1);
    }
    return true;
}

bool parse_http_request(const std::string& raw, macauth::HttpRequest& R) {
    // Header block ends at the first empty line (CRLF or LF).
    std::size_t hdr_end = raw.find("\r\n\r\n");
    std::size_t body_off = hdr_end + 4;
    const std::size_t lf_end = raw.find("\n\n");
    if (lf_end != std::string::npos && (hdr_end == std::string::npos || lf_end < hdr_end)) {
        hdr_end = lf_end;
        body_off = lf_end + 2;
    }
    if (hdr_end == std::string::npos) {
        hdr_end = raw.size();
        body_off = raw.size();
    }

    std::istringstream hdrs(raw.substr(0, hdr_end));
    std::string line;
    if (!std::getline(hdrs, line)) return false;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (!parse_request_line(line, R)) return false;

    R.headers.clear();
    while (std::getline(hdrs, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        std::size_t c = line.find(':');
        if (c == std::string::npos) return false;
        std::string k = line.substr(0, c), v = line.substr(c + 1);
        trim_inplace(k);
        trim_inplace(v);
        if (k.empty()) return false;
        set_hdr_ci(R, k, v);
    }

    R.body.clear();
    const std::string cl = hdr_ci(R, "Content-Length");
    if (cl.empty()) {
        if (body_off < raw.size()) R.body = raw.substr(body_off);
        return true;
    }
    // Digits only: no sign, no trailing junk.
    std::size_t content_len = 0;
    const char* first = cl.data();
    const char* last  = cl.data() + cl.size();
    if (*first < '0' || *first > '9') return false;
    auto res = std::from_chars(first, last, content_len);
    if (res.ec != std::errc() || res.ptr != last) return false;
    if (body_off > raw.size() || content_len > raw.size() - body_off) return false; // truncated body
    R.body = raw.substr(body_off, content_len);
    return true;
}

std::string hdr_ci(const macauth::HttpRequest& R, const char* name){
    auto it = R.headers.find(name);
    if (it != R.headers.end()) return it->second;
    for (const auto& kv : R.headers){
        if (strcasecmp(kv.first.c_str(), name)==0) return kv.second;
    }
    return {};
}

void set_hdr_ci(macauth::HttpRequest& R, const std::string& name, const std::string& value){
    for (auto it = R.headers.begin(); it != R.headers.end(); ){
        if (strcasecmp(it->first.c_str(), name.c_str())==0) it = R.headers.erase(it);
        else ++it;
    }
    R.headers[name] = value;
}

} // namespace macauth::internal

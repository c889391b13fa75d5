/*
 * Part of the MacAuth (MA) project.
 *
 * SPDX-FileCopyrightText: 2025 MacAuth contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of MacAuth (MA). See LICENSE for details.
 */

#include "macauth/internal/canonical.hpp"
#include "macauth/internal/http_parser.hpp"
#include "macauth/internal/utils.hpp"
#include "macauth/errors.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace macauth::internal {

static std::uint16_t default_port(const std::string& scheme) {
    const std::string s = lower_copy(scheme);
    if (s == "http")  return 80;
    if (s == "https") return 443;
    throw UnknownScheme(scheme);
}

static std::uint16_t parse_port(const std::string& s) {
    if (s.empty() || s.size() > 5 ||
        !std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; }))
    {
        throw InvalidParameter("bad port in Host header: " + s);
    }
    const unsigned long v = std::stoul(s);
    if (v == 0 || v > 65535) throw InvalidParameter("bad port in Host header: " + s);
    return static_cast<std::uint16_t>(v);
}

HostPort resolve_host_port(const macauth::HttpRequest& R) {
    std::string host = hdr_ci(R, "Host");
    trim_inplace(host);

    std::string port_s;
    bool has_port = false;   // "host:" with nothing after the colon is still a port
    if (!host.empty() && host[0] == '[') {
        // IPv6 literal: "[::1]" or "[::1]:8080"
        const std::size_t close = host.find(']');
        if (close == std::string::npos) throw InvalidParameter("bad IPv6 Host header");
        if (close + 1 < host.size()) {
            if (host[close + 1] != ':') throw InvalidParameter("bad IPv6 Host header");
            port_s = host.substr(close + 2);
            has_port = true;
        }
        host.resize(close + 1);
    } else {
        const std::size_t colon = host.rfind(':');
        if (colon != std::string::npos) {
            port_s = host.substr(colon + 1);
            host.resize(colon);
            has_port = true;
        }
    }

    HostPort hp;
    hp.host = lower_copy(host);
    hp.port = has_port ? parse_port(port_s) : default_port(R.scheme);
    return hp;
}

static const std::string& require(const ParamMap& params, const char* name) {
    auto it = params.find(name);
    if (it == params.end()) throw MissingParameter(name);
    return it->second;
}

std::string normalized_request_string(const macauth::HttpRequest& R, const ParamMap& params)
{
    const std::string& ts    = require(params, "ts");
    const std::string& nonce = require(params, "nonce");
    auto ext_it = params.find("ext");
    const HostPort hp = resolve_host_port(R);

    std::ostringstream oss;
    oss << ts                  << "\n"
        << nonce               << "\n"
        << upper_copy(R.method) << "\n"
        << R.path;
    if (!R.query.empty()) oss << '?' << R.query;
    oss << "\n"
        << hp.host             << "\n"
        << hp.port             << "\n"
        << (ext_it != params.end() ? ext_it->second : std::string()) << "\n";
    return oss.str();
}

} // namespace macauth::internal

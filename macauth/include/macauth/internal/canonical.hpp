/*
 * Part of the MacAuth (MA) project.
 *
 * SPDX-FileCopyrightText: 2025 MacAuth contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of MacAuth (MA). See LICENSE for details.
 */

#pragma once
#include <cstdint>
#include <string>
#include "macauth/http_request.hpp"
#include "macauth/types.hpp"

namespace macauth::internal {

// Host header split into lowercase host and port. The port comes from the
// header if present, else from the scheme (http 80, https 443).
// Throws UnknownScheme / InvalidParameter.
struct HostPort {
    std::string host;
    std::uint16_t port = 0;
};
HostPort resolve_host_port(const macauth::HttpRequest& R);

// The string that gets signed, one field per line, each ending in '\n':
//   ts, nonce, METHOD, path[?query], host, port, ext
// Throws MissingParameter if ts or nonce is absent.
std::string normalized_request_string(const macauth::HttpRequest& R, const ParamMap& params);

} // namespace macauth::internal

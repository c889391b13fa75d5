/*
 * Part of the MacAuth (MA) project.
 *
 * SPDX-FileCopyrightText: 2025 MacAuth contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of MacAuth (MA). See LICENSE for details.
 */

#pragma once
#include <optional>
#include <string>
#include "macauth/http_request.hpp"
#include "macauth/types.hpp"

namespace macauth::internal {

// Parse  <scheme> k1=v1, k2="v 2", ...  into scheme + params.
// Quoted values may contain commas and backslash escapes. Throws
// MalformedHeader with the failing ParseError.
AuthzHeader parse_authz_header(const std::string& value);

// Same, but reads the request's Authorization header (missing == empty).
AuthzHeader parse_authz_header(const macauth::HttpRequest& R);

// Fallback variants: return def instead of throwing.
AuthzHeader parse_authz_header(const std::string& value, const AuthzHeader& def);
AuthzHeader parse_authz_header(const macauth::HttpRequest& R, const AuthzHeader& def);

std::optional<AuthzHeader> try_parse_authz_header(const std::string& value);

// Serialize with every value quoted. id, ts, nonce, ext and mac come first.
std::string serialize_authz_header(const AuthzHeader& h);

} // namespace macauth::internal

/*
 * Part of the MacAuth (MA) project.
 *
 * SPDX-FileCopyrightText: 2025 MacAuth contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of MacAuth (MA). See LICENSE for details.
 */

#pragma once
#include <string>
#include "macauth/http_request.hpp"

namespace macauth::internal {

// Parse "GET /path?x=1 HTTP/1.1"
bool parse_request_line(const std::string& line, macauth::HttpRequest& r);

// Parse a complete request (request line, headers, body up to Content-Length).
// Accepts CRLF or bare LF line endings.
bool parse_http_request(const std::string& raw, macauth::HttpRequest& r);

// Case-insensitive header lookup
std::string hdr_ci(const macauth::HttpRequest& R, const char* name);

// Replace (case-insensitively) or add a header.
void set_hdr_ci(macauth::HttpRequest& R, const std::string& name, const std::string& value);

} // namespace macauth::internal

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
#include <unordered_map>

namespace macauth {

// Plain HTTP request structure as produced by our parser.
struct HttpRequest {
    std::string method;          // "GET", "POST", ...
    std::string path;            // "/resource/1"
    std::string query;           // "b=1&a=2" (raw, without '?')
    std::string httpver;         // "HTTP/1.1"
    std::string scheme = "http"; // "http" or "https", picks the default port
    std::unordered_map<std::string, std::string> headers;
    std::string body;
};

} // namespace macauth

/*
 * Part of the MacAuth (MA) project.
 *
 * SPDX-FileCopyrightText: 2025 MacAuth contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of MacAuth (MA). See LICENSE for details.
 */

#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace macauth {

// Base of everything the library throws on bad input.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Reasons the Authorization header grammar can reject a value.
enum class ParseError {
    EmptyHeader,        // null, empty or whitespace-only
    MissingParameters,  // scheme token with nothing after it
    MissingEquals,      // "key" with no "=value"
    EmptyKey,           // "=value"
    StrayComma,         // leading, trailing or doubled comma
    UnterminatedQuote,  // quoted value runs to end of input
    UnexpectedQuote,    // '"' inside an unquoted value
    MissingComma        // junk after a closing quote
};

const char* to_string(ParseError e) noexcept;

class MalformedHeader : public Error {
public:
    explicit MalformedHeader(ParseError reason)
        : Error(std::string("malformed authorization header: ") + to_string(reason)),
          _reason(reason) {}
    ParseError reason() const noexcept { return _reason; }
private:
    ParseError _reason;
};

class MissingParameter : public Error {
public:
    explicit MissingParameter(const std::string& name)
        : Error("missing parameter: " + name) {}
};

class InvalidParameter : public Error {
public:
    using Error::Error;
};

// No explicit port and no registered default port for the scheme.
class UnknownScheme : public InvalidParameter {
public:
    explicit UnknownScheme(const std::string& scheme)
        : InvalidParameter("no default port for scheme: " + scheme) {}
};

// Absent or expired cache entry.
class NotFound : public Error {
public:
    NotFound() : Error("cache entry not found") {}
};

// Insertion over a live cache entry. Carries the value already stored.
template <class V>
class KeyExists : public Error {
public:
    explicit KeyExists(V old_value)
        : Error("cache entry already present"), _old(std::move(old_value)) {}
    const V& old_value() const noexcept { return _old; }
private:
    V _old;
};

// OpenSSL primitive failed.
class CryptoError : public Error {
public:
    using Error::Error;
};

} // namespace macauth

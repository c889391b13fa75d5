/*
 * Part of the MacAuth (MA) project.
 *
 * SPDX-FileCopyrightText: 2025 MacAuth contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of MacAuth (MA). See LICENSE for details.
 */

#include "macauth/internal/authz_header.hpp"
#include "macauth/internal/http_parser.hpp"
#include "macauth/errors.hpp"
#include <array>
#include <cctype>
#include <sstream>

namespace macauth {

const char* to_string(ParseError e) noexcept {
    switch (e) {
    case ParseError::EmptyHeader:       return "empty header";
    case ParseError::MissingParameters: return "scheme without parameters";
    case ParseError::MissingEquals:     return "parameter without '='";
    case ParseError::EmptyKey:          return "empty parameter name";
    case ParseError::StrayComma:        return "stray comma";
    case ParseError::UnterminatedQuote: return "unterminated quoted value";
    case ParseError::UnexpectedQuote:   return "unexpected quote";
    case ParseError::MissingComma:      return "missing comma between parameters";
    }
    return "unknown";
}

} // namespace macauth

namespace macauth::internal {

namespace {

enum class State {
    Scheme,              // reading the scheme token
    Key,                 // reading a parameter name
    AwaitingValue,       // just after '='
    UnquotedValue,
    QuotedValue,
    EscapeInQuotedValue, // just after '\' inside quotes
    AfterQuotedValue     // closing quote seen, expecting ',' or end
};

bool is_space(char c) { return std::isspace((unsigned char)c) != 0; }

class AuthzParser {
public:
    explicit AuthzParser(const std::string& in) : _in(in) {}

    AuthzHeader run() {
        for (char c : _in) step(c);
        finish();
        return std::move(_out);
    }

private:
    [[noreturn]] void fail(ParseError e) { throw MalformedHeader(e); }

    void store() {
        _out.params[_key] = _value;
        _key.clear();
        _value.clear();
        _have_param = true;
        _after_comma = false;
    }

    void step(char c) {
        switch (_state) {
        case State::Scheme:
            if (is_space(c)) {
                if (!_out.scheme.empty()) _state = State::Key;
            } else {
                _out.scheme.push_back(c);
            }
            break;

        case State::Key:
            if (c == ',') {
                if (!_key.empty()) fail(ParseError::MissingEquals);
                fail(ParseError::StrayComma);
            } else if (c == '=') {
                if (_key.empty()) fail(ParseError::EmptyKey);
                _state = State::AwaitingValue;
            } else if (is_space(c)) {
                if (!_key.empty()) fail(ParseError::MissingEquals);
            } else if (c == '"') {
                fail(ParseError::UnexpectedQuote);
            } else {
                _key.push_back(c);
            }
            break;

        case State::AwaitingValue:
            if (c == '"') {
                _state = State::QuotedValue;
            } else if (c == ',') {
                store();
                _after_comma = true;
                _state = State::Key;
            } else if (is_space(c)) {
                store();
                _state = State::AfterQuotedValue;
            } else {
                _value.push_back(c);
                _state = State::UnquotedValue;
            }
            break;

        case State::UnquotedValue:
            if (c == ',') {
                store();
                _after_comma = true;
                _state = State::Key;
            } else if (is_space(c)) {
                store();
                _state = State::AfterQuotedValue;
            } else if (c == '"') {
                fail(ParseError::UnexpectedQuote);
            } else {
                _value.push_back(c);
            }
            break;

        case State::QuotedValue:
            if (c == '\\') {
                _state = State::EscapeInQuotedValue;
            } else if (c == '"') {
                store();
                _state = State::AfterQuotedValue;
            } else {
                _value.push_back(c);
            }
            break;

        case State::EscapeInQuotedValue:
            _value.push_back(c);
            _state = State::QuotedValue;
            break;

        case State::AfterQuotedValue:
            if (c == ',') {
                _after_comma = true;
                _state = State::Key;
            } else if (c == '"') {
                fail(ParseError::UnexpectedQuote);
            } else if (!is_space(c)) {
                fail(ParseError::MissingComma);
            }
            break;
        }
    }

    void finish() {
        switch (_state) {
        case State::Scheme:
            if (_out.scheme.empty()) fail(ParseError::EmptyHeader);
            fail(ParseError::MissingParameters);
        case State::Key:
            if (!_key.empty()) fail(ParseError::MissingEquals);
            if (_after_comma) fail(ParseError::StrayComma);
            if (!_have_param) fail(ParseError::MissingParameters);
            break;
        case State::AwaitingValue:
        case State::UnquotedValue:
            store();
            break;
        case State::QuotedValue:
        case State::EscapeInQuotedValue:
            fail(ParseError::UnterminatedQuote);
        case State::AfterQuotedValue:
            break;
        }
    }

    const std::string& _in;
    State       _state = State::Scheme;
    AuthzHeader _out;
    std::string _key;
    std::string _value;
    bool        _have_param  = false;
    bool        _after_comma = false;
};

void append_quoted(std::ostringstream& oss, const std::string& v) {
    oss << '"';
    for (char c : v) {
        if (c == '"' || c == '\\') oss << '\\';
        oss << c;
    }
    oss << '"';
}

} // namespace

AuthzHeader parse_authz_header(const std::string& value) {
    return AuthzParser(value).run();
}

AuthzHeader parse_authz_header(const macauth::HttpRequest& R) {
    return parse_authz_header(hdr_ci(R, "Authorization"));
}

AuthzHeader parse_authz_header(const std::string& value, const AuthzHeader& def) {
    try {
        return parse_authz_header(value);
    } catch (const MalformedHeader&) {
        return def;
    }
}

AuthzHeader parse_authz_header(const macauth::HttpRequest& R, const AuthzHeader& def) {
    return parse_authz_header(hdr_ci(R, "Authorization"), def);
}

std::optional<AuthzHeader> try_parse_authz_header(const std::string& value) {
    try {
        return parse_authz_header(value);
    } catch (const MalformedHeader&) {
        return std::nullopt;
    }
}

std::string serialize_authz_header(const AuthzHeader& h) {
    static const std::array<const char*, 5> kLeading = {"id", "ts", "nonce", "ext", "mac"};

    std::ostringstream oss;
    oss << h.scheme;
    bool first = true;
    auto emit = [&](const std::string& k, const std::string& v) {
        oss << (first ? " " : ", ") << k << '=';
        append_quoted(oss, v);
        first = false;
    };
    for (const char* k : kLeading) {
        auto it = h.params.find(k);
        if (it != h.params.end()) emit(it->first, it->second);
    }
    for (const auto& kv : h.params) {
        bool leading = false;
        for (const char* k : kLeading) leading = leading || kv.first == k;
        if (!leading) emit(kv.first, kv.second);
    }
    return oss.str();
}

} // namespace macauth::internal

// SPDX-License-Identifier: MIT
// Part of MacAuth (MA) project.
// apps/macauth_sign.cpp

#include "macauth/mac_auth.hpp"
#include "macauth/internal/hmac.hpp"
#include "macauth/internal/http_parser.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

static void usage(const char* argv0) {
    std::cerr <<
      "Usage:\n  " << argv0
      << " --id <id> --key <secret> [--in <request file>]\n"
         "  [--hash sha1|sha256|sha512]      (default sha1)\n"
         "  [--ts <unix seconds>] [--nonce <string>] [--ext <string>]\n"
         "  [--scheme http|https]            (default http, picks the default port)\n"
         "  [--print_request 0|1]            (print the signed request instead of the header)\n"
         "Reads a raw HTTP request from --in or stdin and prints the Authorization value.\n";
}

static bool read_all(const std::string& path, std::string& out) {
    if (path.empty() || path == "-") {
        out.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        return true;
    }
    std::ifstream in(path, std::ios::binary);
    if (!in.good()) return false;
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return true;
}

int main(int argc, char** argv) {
    std::string id, key, in_path, hashS, scheme;
    bool print_request = false;
    macauth::ParamMap params;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--id" && i+1 < argc) id = argv[++i];
        else if (a == "--key" && i+1 < argc) key = argv[++i];
        else if (a == "--in" && i+1 < argc) in_path = argv[++i];
        else if (a == "--hash" && i+1 < argc) hashS = argv[++i];
        else if (a == "--ts" && i+1 < argc) params["ts"] = argv[++i];
        else if (a == "--nonce" && i+1 < argc) params["nonce"] = argv[++i];
        else if (a == "--ext" && i+1 < argc) params["ext"] = argv[++i];
        else if (a == "--scheme" && i+1 < argc) scheme = argv[++i];
        else if (a == "--print_request" && i+1 < argc) print_request = (std::stoi(argv[++i]) != 0);
        else { usage(argv[0]); return 2; }
    }
    if (id.empty() || key.empty()) { usage(argv[0]); return 2; }

    macauth::SignOptions opt;
    if (!hashS.empty() && !macauth::internal::parse_hash_alg(hashS, opt.hash)) {
        std::cerr << "Bad --hash: " << hashS << "\n";
        return 2;
    }
    opt.params = params;

    std::string raw;
    if (!read_all(in_path, raw)) {
        std::cerr << "Cannot read request from " << in_path << "\n";
        return 1;
    }
    macauth::HttpRequest req;
    if (!macauth::internal::parse_http_request(raw, req)) {
        std::cerr << "Malformed HTTP request\n";
        return 1;
    }
    if (!scheme.empty()) req.scheme = scheme;

    try {
        const std::string authz = macauth::sign_request(req, id, key, opt);
        if (!print_request) {
            std::cout << authz << "\n";
            return 0;
        }
        std::ostringstream oss;
        oss << req.method << " " << req.path;
        if (!req.query.empty()) oss << "?" << req.query;
        oss << " " << req.httpver << "\r\n";
        for (const auto& kv : req.headers) oss << kv.first << ": " << kv.second << "\r\n";
        oss << "\r\n" << req.body;
        std::cout << oss.str();
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << "\n";
        return 1;
    }
    return 0;
}

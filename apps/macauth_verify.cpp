// SPDX-License-Identifier: MIT
// Part of MacAuth (MA) project.
// apps/macauth_verify.cpp

#include "macauth/verifier.hpp"
#include "macauth/verifier_config.hpp"
#include "macauth/log.hpp"
#include "macauth/internal/hmac.hpp"
#include "macauth/internal/http_parser.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>
#include <unistd.h>   // dup2, STDOUT_FILENO
#include <fcntl.h>    // open

// Silences library logging by redirecting stdout to /dev/null.
// Results go to stderr so they survive.
static void make_logs_quiet() {
    int nullfd = ::open("/dev/null", O_WRONLY);
    if (nullfd >= 0) {
        (void)::dup2(nullfd, STDOUT_FILENO);
        ::close(nullfd);
    }
}

static void usage(const char* argv0) {
    std::cerr <<
      "Usage:\n  " << argv0
      << " --key_file <path> [options] <request file>...\n"
         "  [--nonce_ttl <sec>] [--id_ttl <sec>] [--max_size <n>]\n"
         "  [--hash sha1|sha256|sha512] [--scheme http|https]\n"
         "  [--log_file <path>] [--quiet 0|1]\n"
         "The key file holds one \"<id> <key>\" pair per line.\n"
         "Each file holds one raw HTTP request; files are checked in order against\n"
         "one replay cache. Prints ACCEPT <id> or REJECT per file to stderr.\n";
}

int main(int argc, char** argv) {
    macauth::VerifierConfig cfg;
    std::string hashS, scheme, log_file;
    bool quiet = false;
    std::vector<std::string> files;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--key_file" && i+1 < argc) cfg.key_file = argv[++i];
            else if (a == "--nonce_ttl" && i+1 < argc) cfg.nonce_ttl_sec = std::stoi(argv[++i]);
            else if (a == "--id_ttl" && i+1 < argc) cfg.id_ttl_sec = std::stoi(argv[++i]);
            else if (a == "--max_size" && i+1 < argc) cfg.max_size = std::stoul(argv[++i]);
            else if (a == "--hash" && i+1 < argc) hashS = argv[++i];
            else if (a == "--scheme" && i+1 < argc) scheme = argv[++i];
            else if (a == "--log_file" && i+1 < argc) log_file = argv[++i];
            else if (a == "--quiet" && i+1 < argc) quiet = (std::stoi(argv[++i]) != 0);

            else if (!a.empty() && a[0] != '-') files.push_back(a);
            else { usage(argv[0]); return 2; }
        }
    } catch (const std::exception&) {
        usage(argv[0]);
        return 2;
    }

    if (files.empty()) { usage(argv[0]); return 2; }
    if (!hashS.empty() && !macauth::internal::parse_hash_alg(hashS, cfg.hash)) {
        std::cerr << "Bad --hash: " << hashS << "\n";
        return 2;
    }
    if (cfg.key_file.empty()) {
        std::cerr << "--key_file is required\n";
        return 2;
    }

    // Apply quiet mode before any logging can occur.
    if (quiet) make_logs_quiet();
    if (!log_file.empty()) macauth::set_log_file(log_file);

    int rejected = 0;
    try {
        macauth::Verifier verifier(cfg);
        for (const auto& path : files) {
            std::ifstream in(path, std::ios::binary);
            std::string raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
            macauth::HttpRequest req;
            if (!in.good() && raw.empty()) {
                std::cerr << path << ": REJECT (unreadable)\n";
                ++rejected;
                continue;
            }
            if (!macauth::internal::parse_http_request(raw, req)) {
                std::cerr << path << ": REJECT (malformed request)\n";
                ++rejected;
                continue;
            }
            if (!scheme.empty()) req.scheme = scheme;

            const macauth::VerifyResult vr = verifier.verify(req);
            if (vr.ok) {
                std::cerr << path << ": ACCEPT " << vr.id << "\n";
            } else {
                std::cerr << path << ": REJECT\n";
                ++rejected;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] exception: " << e.what() << "\n";
        return 1;
    }
    return rejected == 0 ? 0 : 1;
}

/*
 * Part of the MacAuth (MA) project.
 *
 * SPDX-FileCopyrightText: 2025 MacAuth contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of MacAuth (MA). See LICENSE for details.
 */

#include <gtest/gtest.h>

#include <fstream>
#include <stdexcept>
#include <string>

#include "macauth/mac_auth.hpp"
#include "macauth/verifier.hpp"
#include "macauth/internal/http_parser.hpp"
#include "macauth/internal/key_store.hpp"

using macauth::HttpRequest;
using macauth::Verifier;
using macauth::VerifierConfig;

namespace {

std::string write_file(const std::string& name, const std::string& body) {
    const std::string path = ::testing::TempDir() + name;
    std::ofstream out(path, std::ios::trunc);
    out << body;
    return path;
}

HttpRequest signed_request(const std::string& id, const std::string& key) {
    HttpRequest r;
    EXPECT_TRUE(macauth::internal::parse_http_request(
        "POST /resource/1?b=1&a=2 HTTP/1.1\r\nHost: example.com\r\nContent-Length: 11\r\n\r\nhello world", r));
    macauth::sign_request(r, id, key);
    return r;
}

VerifierConfig file_config() {
    VerifierConfig cfg;
    cfg.key_file = write_file("macauth_keys.txt",
        "# id secret\n"
        "\n"
        "alice  s3cret-a\n"
        "  bob s3cret-b  \n");
    return cfg;
}

TEST(KeyStore, LoadsKeyFile) {
    macauth::internal::KeyStore ks;
    ASSERT_TRUE(ks.load_file(file_config().key_file));
    EXPECT_EQ(ks.size(), 2u);
    std::string secret;
    ASSERT_TRUE(ks.lookup("alice", secret));
    EXPECT_EQ(secret, "s3cret-a");
    ASSERT_TRUE(ks.lookup("bob", secret));
    EXPECT_EQ(secret, "s3cret-b");
    EXPECT_FALSE(ks.lookup("carol", secret));
}

TEST(KeyStore, RejectsBadFiles) {
    macauth::internal::KeyStore ks;
    EXPECT_FALSE(ks.load_file(::testing::TempDir() + "does-not-exist.txt"));
    EXPECT_FALSE(ks.load_file(write_file("macauth_bad_keys.txt", "alice\n")));
    EXPECT_FALSE(ks.load_file(write_file("macauth_bad_keys2.txt", "alice a b\n")));
    EXPECT_FALSE(ks.load_file(write_file("macauth_dup_keys.txt", "alice a\nalice b\n")));
    std::string secret;
    EXPECT_FALSE(ks.lookup("alice", secret));
    EXPECT_EQ(ks.size(), 0u);
}

TEST(KeyStore, FailedReloadKeepsPreviousKeys) {
    macauth::internal::KeyStore ks;
    ASSERT_TRUE(ks.load_file(file_config().key_file));
    EXPECT_FALSE(ks.load_file(write_file("macauth_bad_keys3.txt", "carol\n")));
    std::string secret;
    EXPECT_TRUE(ks.lookup("alice", secret));
    EXPECT_FALSE(ks.lookup("carol", secret));
}

TEST(KeyStore, PutAddsAndReplaces) {
    macauth::internal::KeyStore ks;
    ks.put("dave", "one");
    ks.put("dave", "two");
    std::string secret;
    ASSERT_TRUE(ks.lookup("dave", secret));
    EXPECT_EQ(secret, "two");
    EXPECT_EQ(ks.size(), 1u);
}

TEST(Verifier, RejectsBadConfig) {
    VerifierConfig cfg;
    cfg.key_file = ::testing::TempDir() + "does-not-exist.txt";
    EXPECT_THROW(Verifier v(cfg), std::runtime_error);
    cfg = file_config();
    cfg.nonce_ttl_sec = 0;
    EXPECT_THROW(Verifier v(cfg), std::runtime_error);
}

TEST(Verifier, KeysCanBeAddedInMemory) {
    Verifier v(VerifierConfig{});
    EXPECT_EQ(v.keys().size(), 0u);
    EXPECT_FALSE(v.verify(signed_request("erin", "k3y")).ok);
    v.keys().put("erin", "k3y");
    const auto vr = v.verify(signed_request("erin", "k3y"));
    EXPECT_TRUE(vr.ok);
    EXPECT_EQ(vr.id, "erin");
}

TEST(Verifier, AcceptsSignedRequestOnce) {
    Verifier v(file_config());
    const HttpRequest req = signed_request("alice", "s3cret-a");
    const auto first = v.verify(req);
    EXPECT_TRUE(first.ok);
    EXPECT_EQ(first.id, "alice");
    EXPECT_EQ(v.nonces().len(), 1u);

    const auto replay = v.verify(req);
    EXPECT_FALSE(replay.ok);
    EXPECT_TRUE(replay.id.empty());
}

TEST(Verifier, RejectsUnknownIdAndWrongKey) {
    Verifier v(file_config());
    EXPECT_FALSE(v.verify(signed_request("carol", "whatever")).ok);
    EXPECT_FALSE(v.verify(signed_request("bob", "s3cret-a")).ok);
    EXPECT_TRUE(v.verify(signed_request("bob", "s3cret-b")).ok);
}

TEST(Verifier, RejectsUnsignedRequest) {
    Verifier v(file_config());
    HttpRequest r;
    ASSERT_TRUE(macauth::internal::parse_http_request("GET / HTTP/1.1\r\nHost: example.com\r\n\r\n", r));
    EXPECT_FALSE(v.verify(r).ok);
}

TEST(Verifier, HonoursConfiguredHash) {
    VerifierConfig cfg = file_config();
    cfg.hash = macauth::HashAlg::Sha512;
    Verifier v(cfg);

    HttpRequest r;
    ASSERT_TRUE(macauth::internal::parse_http_request("GET /x HTTP/1.1\r\nHost: example.com\r\n\r\n", r));
    macauth::SignOptions opt;
    opt.hash = macauth::HashAlg::Sha512;
    macauth::sign_request(r, "alice", "s3cret-a", opt);
    EXPECT_TRUE(v.verify(r).ok);
    EXPECT_FALSE(v.verify(signed_request("alice", "s3cret-a")).ok);
}

} // namespace

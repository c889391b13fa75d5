/*
 * Part of the MacAuth (MA) project.
 *
 * SPDX-FileCopyrightText: 2025 MacAuth contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of MacAuth (MA). See LICENSE for details.
 */

#include "macauth/internal/hmac.hpp"
#include "macauth/internal/utils.hpp"
#include "macauth/errors.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace macauth::internal {

static const EVP_MD* evp_for(HashAlg alg) {
    switch (alg) {
    case HashAlg::Sha1:   return EVP_sha1();
    case HashAlg::Sha256: return EVP_sha256();
    case HashAlg::Sha512: return EVP_sha512();
    }
    return nullptr;
}

std::string hmac_bin(HashAlg alg, const std::string& key, const std::string& msg)
{
    const EVP_MD* md = evp_for(alg);
    if (!md) throw CryptoError("unsupported hash");

    unsigned int mac_len = 0;
    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned char* p = HMAC(md,
                            key.data(), (int)key.size(),
                            reinterpret_cast<const unsigned char*>(msg.data()),
                            msg.size(),
                            mac, &mac_len);
    if (!p || mac_len != (unsigned int)EVP_MD_size(md)) {
        throw CryptoError("HMAC failed");
    }
    return std::string(reinterpret_cast<const char*>(mac), mac_len);
}

std::string hmac_base64(HashAlg alg, const std::string& key, const std::string& msg)
{
    std::string bin = hmac_bin(alg, key, msg);
    std::string b64 = base64_encode(bin);
    secure_wipe(bin);
    return b64;
}

bool parse_hash_alg(const std::string& name, HashAlg& out) {
    const std::string n = lower_copy(name);
    if (n == "sha1")   { out = HashAlg::Sha1;   return true; }
    if (n == "sha256") { out = HashAlg::Sha256; return true; }
    if (n == "sha512") { out = HashAlg::Sha512; return true; }
    return false;
}

} // namespace macauth::internal

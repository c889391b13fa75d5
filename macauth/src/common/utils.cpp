/*
 * Part of the MacAuth (MA) project.
 *
 * SPDX-FileCopyrightText: 2025 MacAuth contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of MacAuth (MA). See LICENSE for details.
 */

#include "macauth/internal/utils.hpp"
#include "macauth/errors.hpp"
#include <cctype>
#include <vector>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace macauth::internal {

void trim_inplace(std::string& s) {
    std::size_t a = 0;
    while (a < s.size() && std::isspace((unsigned char)s[a])) ++a;
    std::size_t b = s.size();
    while (b > a && std::isspace((unsigned char)s[b-1])) --b;
    if (a > 0 || b < s.size()) s.assign(s.begin()+a, s.begin()+b);
}

std::string bytes_to_hex(const unsigned char* p, std::size_t n){
    static const char* H="0123456789abcdef";
    std::string s; s.resize(n*2);
    for(std::size_t i=0;i<n;++i){ s[2*i]=H[p[i]>>4]; s[2*i+1]=H[p[i]&0xF]; }
    return s;
}

std::string random_hex(std::size_t n_bytes){
    std::string b; b.resize(n_bytes);
    if (RAND_bytes((unsigned char*)b.data(), (int)b.size()) != 1) {
        throw CryptoError("RAND_bytes failed");
    }
    std::string hex = bytes_to_hex((const unsigned char*)b.data(), b.size());
    secure_wipe(b);
    return hex;
}

std::string base64_encode(const std::string& bin){
    if (bin.empty()) return {};
    // 4 output chars per 3 input bytes, plus NUL
    std::vector<unsigned char> out(4 * ((bin.size() + 2) / 3) + 1);
    const int n = EVP_EncodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(bin.data()),
                                  (int)bin.size());
    if (n < 0) throw CryptoError("EVP_EncodeBlock failed");
    return std::string(reinterpret_cast<const char*>(out.data()), (std::size_t)n);
}

bool ct_equal(const std::string& a, const std::string& b){
    if(a.size()!=b.size()) return false;
    if(a.empty()) return true;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string upper_copy(std::string s){
    for(char& c: s) c = (char)std::toupper((unsigned char)c);
    return s;
}
std::string lower_copy(std::string s){
    for(char& c: s) c = (char)std::tolower((unsigned char)c);
    return s;
}

void secure_wipe(std::string& s){
    if(!s.empty()){
        OPENSSL_cleanse(s.data(), s.size());
        s.clear();
        s.shrink_to_fit();
    }
}

} // namespace macauth::internal

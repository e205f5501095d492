/*
 * Part of the Shelf project.
 *
 * SPDX-FileCopyrightText: 2025 Shelf contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Shelf. See LICENSE for details.
 */

#include "shelf/internal/utils.hpp"
#include <algorithm>
#include <cctype>
#include <openssl/sha.h>
#include <openssl/rand.h>

namespace shelf::internal {

void trim_inplace(std::string& s) {
    std::size_t a = 0;
    while (a < s.size() && std::isspace((unsigned char)s[a])) ++a;
    std::size_t b = s.size();
    while (b > a && std::isspace((unsigned char)s[b-1])) --b;
    if (a > 0 || b < s.size()) s.assign(s.begin()+a, s.begin()+b);
}

std::string lower_copy(std::string s){
    for(char& c: s) c = (char)std::tolower((unsigned char)c);
    return s;
}

std::vector<std::string> split_char(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::size_t p = 0;
    while (true) {
        std::size_t n = s.find(sep, p);
        if (n == std::string::npos) {
            out.push_back(s.substr(p));
            break;
        }
        out.push_back(s.substr(p, n - p));
        p = n + 1;
    }
    return out;
}

std::string path_remainder(const std::string& path) {
    const std::vector<std::string> segs = split_char(path, '/');
    std::string out;
    for (std::size_t i = 2; i < segs.size(); ++i) {
        if (i > 2) out.push_back('/');
        out += segs[i];
    }
    return out;
}

bool is_safe_key(const std::string& key) {
    if (key.empty() || key[0] == '/') return false;
    if (key.find('\0') != std::string::npos) return false;
    for (const auto& seg : split_char(key, '/')) {
        if (seg == "..") return false;
    }
    return true;
}

std::string bytes_to_hex(const unsigned char* p, std::size_t n){
    static const char* H="0123456789abcdef";
    std::string s; s.resize(n*2);
    for(std::size_t i=0;i<n;++i){ s[2*i]=H[p[i]>>4]; s[2*i+1]=H[p[i]&0xF]; }
    return s;
}

std::string sha256_hex(const std::string& data) {
    unsigned char d[SHA256_DIGEST_LENGTH];
    SHA256((const unsigned char*)data.data(), data.size(), d);
    return bytes_to_hex(d, SHA256_DIGEST_LENGTH);
}

std::string random_hex(std::size_t n_bytes){
    std::string b; b.resize(n_bytes);
    if (RAND_bytes((unsigned char*)b.data(), (int)b.size()) != 1) return {};
    return bytes_to_hex((const unsigned char*)b.data(), b.size());
}

} // namespace shelf::internal

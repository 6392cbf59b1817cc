/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qcsim/crypto/sha256.hpp"
#include <openssl/evp.h>
#include <memory>
#include <stdexcept>

namespace qcsim {
namespace crypto {

std::vector<uint8_t> sha256(const std::string& data) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("Failed to create EVP_MD_CTX");
    }

    std::vector<uint8_t> hash(32);
    unsigned int len = 32;

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize SHA256");
    }
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("Failed to update SHA256");
    }
    if (EVP_DigestFinal_ex(ctx.get(), hash.data(), &len) != 1) {
        throw std::runtime_error("Failed to finalize SHA256");
    }

    hash.resize(len);
    return hash;
}

std::string to_hex(const std::vector<uint8_t>& bytes) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

} // namespace crypto
} // namespace qcsim

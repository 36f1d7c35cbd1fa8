// Copyright (c) 2026 The Antiquity Core developers
// Distributed under the MIT software license

#include <crypto/sha3.h>

#include <openssl/evp.h>

#include <stdexcept>

void SHA3_256(const uint8_t* data, size_t len, uint8_t hash[32]) {
    // Validate inputs
    if (data == nullptr && len > 0) {
        throw std::invalid_argument("SHA3_256: data is NULL but len > 0");
    }
    if (hash == nullptr) {
        throw std::invalid_argument("SHA3_256: hash output buffer is NULL");
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw std::runtime_error("SHA3_256: failed to allocate digest context");
    }

    if (EVP_DigestInit_ex(ctx, EVP_sha3_256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("SHA3_256: digest init failed");
    }

    // EVP_DigestUpdate with len == 0 is a no-op, a NULL pointer is fine there
    if (len > 0 && EVP_DigestUpdate(ctx, data, len) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("SHA3_256: digest update failed");
    }

    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &out_len) != 1 || out_len != 32) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("SHA3_256: digest final failed");
    }

    EVP_MD_CTX_free(ctx);
}

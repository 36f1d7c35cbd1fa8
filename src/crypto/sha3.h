// Copyright (c) 2026 The Antiquity Core developers
// Distributed under the MIT software license

#ifndef ANTIQUITY_CRYPTO_SHA3_H
#define ANTIQUITY_CRYPTO_SHA3_H

#include <stdint.h>
#include <stdlib.h>

/**
 * SHA-3 (Keccak) hashing, NIST FIPS 202
 *
 * Backed by OpenSSL's EVP_sha3_256. Used for hardware fingerprints,
 * merkle leaves and nodes, block hashes and wallet address derivation.
 */

/**
 * Compute SHA3-256 hash of data (one-shot function)
 *
 * @param data Input data to hash (may be NULL only when len == 0)
 * @param len Length of input data in bytes
 * @param hash Output buffer for 32-byte hash
 *
 * Throws std::invalid_argument on NULL buffers and std::runtime_error if
 * the OpenSSL digest cannot be computed.
 */
void SHA3_256(const uint8_t* data, size_t len, uint8_t hash[32]);

/**
 * Hash a uint256 value with SHA3-256
 *
 * @param data 32-byte input value
 * @param hash Output buffer for 32-byte hash
 */
inline void SHA3_256_uint256(const uint8_t data[32], uint8_t hash[32]) {
    SHA3_256(data, 32, hash);
}

#endif // ANTIQUITY_CRYPTO_SHA3_H

// Copyright (c) 2026 The Antiquity Core developers
// Distributed under the MIT software license

/**
 * SHA3-256 Tests
 *
 * NIST FIPS 202 known-answer vectors and input validation.
 */

#include <boost/test/unit_test.hpp>

#include <crypto/sha3.h>
#include <util/strencodings.h>

#include <stdexcept>
#include <string>
#include <vector>

BOOST_AUTO_TEST_SUITE(sha3_tests)

static std::string Sha3Hex(const std::string& input) {
    uint8_t hash[32];
    SHA3_256(reinterpret_cast<const uint8_t*>(input.data()), input.size(), hash);
    return HexStr(hash, 32);
}

BOOST_AUTO_TEST_CASE(sha3_256_empty) {
    BOOST_CHECK_EQUAL(Sha3Hex(""),
                      "a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a");
}

BOOST_AUTO_TEST_CASE(sha3_256_abc) {
    BOOST_CHECK_EQUAL(Sha3Hex("abc"),
                      "3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532");
}

BOOST_AUTO_TEST_CASE(sha3_256_null_input_with_zero_length) {
    uint8_t hash[32];
    BOOST_CHECK_NO_THROW(SHA3_256(nullptr, 0, hash));
    BOOST_CHECK_EQUAL(HexStr(hash, 32),
                      "a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a");
}

BOOST_AUTO_TEST_CASE(sha3_256_rejects_null_buffers) {
    uint8_t hash[32];
    BOOST_CHECK_THROW(SHA3_256(nullptr, 4, hash), std::invalid_argument);

    const uint8_t data[4] = {1, 2, 3, 4};
    BOOST_CHECK_THROW(SHA3_256(data, sizeof(data), nullptr), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(sha3_256_uint256_helper) {
    uint8_t input[32] = {0};
    uint8_t a[32], b[32];
    SHA3_256_uint256(input, a);
    SHA3_256(input, 32, b);
    BOOST_CHECK_EQUAL(HexStr(a, 32), HexStr(b, 32));
}

BOOST_AUTO_TEST_SUITE_END()

// Copyright (c) 2026 The Antiquity Core developers
// Distributed under the MIT software license

#ifndef ANTIQUITY_CONSENSUS_MINING_PROOF_H
#define ANTIQUITY_CONSENSUS_MINING_PROOF_H

#include <entropy/entropy_proof.h>
#include <primitives/block.h>
#include <primitives/hardware.h>

#include <cstdint>
#include <optional>
#include <string>

namespace antiquity {

/**
 * Deep entropy evidence attached to a proof, scored against profile_id.
 */
struct EntropyAttestation {
    std::string profile_id;
    entropy::EntropyProof proof;
};

/**
 * Hardware attestation submitted by a miner for the current block window.
 *
 * Delivered already deserialized and signature-checked by the network layer.
 */
struct MiningProof {
    std::string wallet;
    HardwareInfo hardware;
    uint256 anti_emulation_hash;
    int64_t timestamp = 0;
    uint64_t nonce = 0;
    std::optional<EntropyAttestation> entropy_attestation;
};

/**
 * Accepted proof, held only until the window is sealed or reset.
 */
struct ValidatedProof {
    std::string wallet;
    HardwareInfo hardware;
    double multiplier = 0.0;    // Capped
    uint256 anti_emulation_hash;
    int64_t validated_at = 0;
};

} // namespace antiquity

#endif // ANTIQUITY_CONSENSUS_MINING_PROOF_H

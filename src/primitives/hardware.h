// Copyright (c) 2026 The Antiquity Core developers
// Distributed under the MIT software license

#ifndef ANTIQUITY_PRIMITIVES_HARDWARE_H
#define ANTIQUITY_PRIMITIVES_HARDWARE_H

#include <consensus/hardware_tier.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace antiquity {

//==============================================================================
// Wallet addresses
//==============================================================================

/** Address prefix for RTC wallets */
static const char* const WALLET_ADDRESS_PREFIX = "RTC";

/** True when the address carries the RTC prefix and is at least 20 chars */
bool IsValidWalletAddress(const std::string& address);

/** "RTC" + hex of the first 20 bytes of SHA3-256(public key) */
std::string WalletAddressFromPublicKey(const std::vector<uint8_t>& public_key);

//==============================================================================
// Hardware descriptors
//==============================================================================

/** Cache sizes in KB as reported by the miner */
struct CacheSizes {
    uint32_t l1_data = 0;
    uint32_t l1_instruction = 0;
    uint32_t l2 = 0;
    std::optional<uint32_t> l3;
};

/**
 * Detailed hardware report used by the anti-emulation checks.
 */
struct HardwareCharacteristics {
    std::string cpu_model;
    uint32_t cpu_family = 0;
    std::vector<std::string> cpu_flags;
    CacheSizes cache_sizes;
    std::map<std::string, uint64_t> instruction_timings;  // instruction -> cycles
    std::string unique_id;

    bool HasFlag(const std::string& flag) const;
};

/**
 * Declared hardware of a mining proof.
 */
struct HardwareInfo {
    std::string model;
    std::string generation;
    uint32_t age_years = 0;
    HardwareTier tier = HardwareTier::Recent;
    double multiplier = 0.5;
    std::optional<HardwareCharacteristics> characteristics;

    /** Derive tier and multiplier from the declared age */
    static HardwareInfo Create(const std::string& model, const std::string& generation,
                               uint32_t age_years);

    /** Copy with the founder bonus (x1.1) applied to the multiplier */
    HardwareInfo WithFounderBonus() const;

    /** "<model> (<generation>)" */
    std::string GetLabel() const;
};

} // namespace antiquity

#endif // ANTIQUITY_PRIMITIVES_HARDWARE_H

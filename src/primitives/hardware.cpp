// Copyright (c) 2026 The Antiquity Core developers
// Distributed under the MIT software license

#include <primitives/hardware.h>
#include <consensus/params.h>
#include <crypto/sha3.h>
#include <util/strencodings.h>

#include <algorithm>

namespace antiquity {

bool IsValidWalletAddress(const std::string& address) {
    return address.size() >= 20 && address.compare(0, 3, WALLET_ADDRESS_PREFIX) == 0;
}

std::string WalletAddressFromPublicKey(const std::vector<uint8_t>& public_key) {
    uint8_t hash[32];
    SHA3_256(public_key.data(), public_key.size(), hash);
    return std::string(WALLET_ADDRESS_PREFIX) + HexStr(hash, 20);
}

bool HardwareCharacteristics::HasFlag(const std::string& flag) const {
    return std::find(cpu_flags.begin(), cpu_flags.end(), flag) != cpu_flags.end();
}

HardwareInfo HardwareInfo::Create(const std::string& model, const std::string& generation,
                                  uint32_t age_years) {
    HardwareInfo info;
    info.model = model;
    info.generation = generation;
    info.age_years = age_years;
    info.tier = TierFromAge(age_years);
    info.multiplier = TierMultiplier(info.tier);
    return info;
}

HardwareInfo HardwareInfo::WithFounderBonus() const {
    HardwareInfo bonus = *this;
    bonus.multiplier *= Consensus::FOUNDER_BONUS;
    return bonus;
}

std::string HardwareInfo::GetLabel() const {
    return model + " (" + generation + ")";
}

} // namespace antiquity

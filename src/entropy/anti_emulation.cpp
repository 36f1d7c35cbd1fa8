// Copyright (c) 2026 The Antiquity Core developers
// Distributed under the MIT software license

#include "anti_emulation.h"

#include <util/logging.h>
#include <util/strencodings.h>

#include <utility>

namespace entropy {

AntiEmulationVerifier::AntiEmulationVerifier(std::shared_ptr<const HardwareProfileRegistry> registry)
    : registry_(std::move(registry)) {}

AntiEmulationResult AntiEmulationVerifier::verify(
    const antiquity::HardwareCharacteristics& characteristics) const {
    AntiEmulationResult result;
    if (!registry_) {
        return result;
    }

    const CpuFamilySignature* signature = registry_->find_family_signature(characteristics.cpu_family);
    if (signature) {
        uint32_t l1 = characteristics.cache_sizes.l1_data;
        if (l1 < signature->cache_ranges.l1_min || l1 > signature->cache_ranges.l1_max) {
            result.status = AntiEmulationStatus::SUSPICIOUS_HARDWARE;
            result.reason = "L1 cache size mismatch";
            LogPrintValidation(DEBUG, "Family %u: L1 data cache %u KB outside %u-%u KB",
                               characteristics.cpu_family, l1,
                               signature->cache_ranges.l1_min, signature->cache_ranges.l1_max);
            return result;
        }

        for (const auto& flag : signature->expected_flags) {
            if (!characteristics.HasFlag(flag)) {
                result.status = AntiEmulationStatus::SUSPICIOUS_HARDWARE;
                result.reason = "Missing expected CPU flags";
                LogPrintValidation(DEBUG, "Family %u: missing CPU flag '%s'",
                                   characteristics.cpu_family, flag.c_str());
                return result;
            }
        }
    }

    for (const auto& timing : characteristics.instruction_timings) {
        const TimingBaseline* baseline =
            registry_->find_timing_baseline(characteristics.cpu_family, timing.first);
        if (!baseline) {
            continue;
        }
        if (timing.second < baseline->min_cycles || timing.second > baseline->max_cycles) {
            result.status = AntiEmulationStatus::EMULATION_DETECTED;
            result.reason = strprintf("%s took %llu cycles (expected %llu-%llu)",
                                      timing.first.c_str(),
                                      static_cast<unsigned long long>(timing.second),
                                      static_cast<unsigned long long>(baseline->min_cycles),
                                      static_cast<unsigned long long>(baseline->max_cycles));
            return result;
        }
    }

    return result;
}

} // namespace entropy

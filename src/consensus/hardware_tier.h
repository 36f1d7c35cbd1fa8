// Copyright (c) 2026 The Antiquity Core developers
// Distributed under the MIT software license

#ifndef ANTIQUITY_CONSENSUS_HARDWARE_TIER_H
#define ANTIQUITY_CONSENSUS_HARDWARE_TIER_H

#include <amount.h>

#include <cstdint>

namespace antiquity {

/**
 * Hardware age brackets, oldest first.
 *
 *   Ancient  30+ years   3.5x
 *   Sacred   25-29       3.0x
 *   Vintage  20-24       2.5x
 *   Classic  15-19       2.0x
 *   Retro    10-14       1.5x
 *   Modern    5-9        1.0x
 *   Recent    0-4        0.5x
 */
enum class HardwareTier {
    Ancient,
    Sacred,
    Vintage,
    Classic,
    Retro,
    Modern,
    Recent
};

/**
 * Map a declared hardware age to its tier.
 * Total over all ages; boundary values resolve to the older tier.
 */
HardwareTier TierFromAge(uint32_t age_years);

/** Fixed reward multiplier of a tier */
double TierMultiplier(HardwareTier tier);

/** Display name ("Ancient Silicon", ..., "Recent Hardware") */
const char* TierName(HardwareTier tier);

/**
 * Antiquity Score: (CURRENT_YEAR - release_year) * log10(uptime_days + 1).
 * Hardware from the future contributes an age of zero.
 */
double CalculateAntiquityScore(int release_year, uint64_t uptime_days,
                               int current_year);
double CalculateAntiquityScore(int release_year, uint64_t uptime_days);

/**
 * Reward earned for a score: floor(total * min(1, score / AS_MAX)).
 * Negative scores earn nothing.
 */
CAmount CalculateAntiquityReward(double score, CAmount total_reward);

} // namespace antiquity

#endif // ANTIQUITY_CONSENSUS_HARDWARE_TIER_H

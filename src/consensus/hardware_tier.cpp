// Copyright (c) 2026 The Antiquity Core developers
// Distributed under the MIT software license

#include <consensus/hardware_tier.h>
#include <consensus/params.h>

#include <algorithm>
#include <cmath>

namespace antiquity {

HardwareTier TierFromAge(uint32_t age_years) {
    if (age_years >= 30) return HardwareTier::Ancient;
    if (age_years >= 25) return HardwareTier::Sacred;
    if (age_years >= 20) return HardwareTier::Vintage;
    if (age_years >= 15) return HardwareTier::Classic;
    if (age_years >= 10) return HardwareTier::Retro;
    if (age_years >= 5) return HardwareTier::Modern;
    return HardwareTier::Recent;
}

double TierMultiplier(HardwareTier tier) {
    switch (tier) {
        case HardwareTier::Ancient: return 3.5;
        case HardwareTier::Sacred: return 3.0;
        case HardwareTier::Vintage: return 2.5;
        case HardwareTier::Classic: return 2.0;
        case HardwareTier::Retro: return 1.5;
        case HardwareTier::Modern: return 1.0;
        case HardwareTier::Recent: return 0.5;
    }
    return 0.5;
}

const char* TierName(HardwareTier tier) {
    switch (tier) {
        case HardwareTier::Ancient: return "Ancient Silicon";
        case HardwareTier::Sacred: return "Sacred Silicon";
        case HardwareTier::Vintage: return "Vintage Era";
        case HardwareTier::Classic: return "Classic Era";
        case HardwareTier::Retro: return "Retro Tech";
        case HardwareTier::Modern: return "Modern Hardware";
        case HardwareTier::Recent: return "Recent Hardware";
    }
    return "Unknown";
}

double CalculateAntiquityScore(int release_year, uint64_t uptime_days,
                               int current_year) {
    int age = std::max(0, current_year - release_year);
    return static_cast<double>(age) * std::log10(static_cast<double>(uptime_days) + 1.0);
}

double CalculateAntiquityScore(int release_year, uint64_t uptime_days) {
    return CalculateAntiquityScore(release_year, uptime_days, Consensus::CURRENT_YEAR);
}

CAmount CalculateAntiquityReward(double score, CAmount total_reward) {
    if (score <= 0.0 || total_reward <= 0) {
        return 0;
    }
    double ratio = std::min(1.0, score / Consensus::AS_MAX);
    return static_cast<CAmount>(std::floor(static_cast<double>(total_reward) * ratio));
}

} // namespace antiquity
